/* Disjoint sets with path compression and union by rank. */
#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

class UnionFind {
public:
  explicit UnionFind(NodeId n) : parent_(n), rank_(n, 0), components_(n) {
    for (NodeId i = 0; i < n; ++i) parent_[i] = i;
  }

  [[nodiscard]] NodeId find(NodeId x) noexcept {
    NodeId root = x;
    while (parent_[root] != root) root = parent_[root];
    while (parent_[x] != root) {
      const auto next = parent_[x];
      parent_[x] = root;
      x = next;
    }
    return root;
  }

  // False when a and b were already in the same set.
  bool unite(NodeId a, NodeId b) noexcept {
    a = find(a);
    b = find(b);
    if (a == b) return false;
    if (rank_[a] < rank_[b]) std::swap(a, b);
    parent_[b] = a;
    if (rank_[a] == rank_[b]) ++rank_[a];
    --components_;
    return true;
  }

  [[nodiscard]] NodeId size() const noexcept { return static_cast<NodeId>(parent_.size()); }
  [[nodiscard]] NodeId num_components() const noexcept { return components_; }

private:
  std::vector<NodeId> parent_;
  std::vector<std::uint8_t> rank_;
  NodeId components_;
};

} // namespace ensgraph::core
