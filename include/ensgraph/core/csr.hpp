/* Immutable CSR adjacency: offsets (N+1) and per-node sorted destinations. */
#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Notes on edge identifiers:
// - EdgeId is the position of a directed edge in the destinations array.
//   Edges are ordered by (src, dst), so the edges of node u occupy
//   [offsets[u], offsets[u+1]) and their destinations are non-decreasing.
// - get_unchecked_* accessors perform no bounds checks and are meant for
//   hot loops that already validated their inputs; the checked variants
//   throw InvalidNodeId / InvalidEdgeId.
class Csr {
public:
  Csr() : offsets_(1, 0) {}

  // Takes ownership of already-validated arrays.
  Csr(std::vector<EdgeId> offsets, std::vector<NodeId> destinations);

  [[nodiscard]] NodeId num_nodes() const noexcept { return static_cast<NodeId>(offsets_.size() - 1); }
  [[nodiscard]] EdgeId num_edges() const noexcept { return static_cast<EdgeId>(destinations_.size()); }

  [[nodiscard]] std::span<const EdgeId> offsets_view() const noexcept { return offsets_; }
  [[nodiscard]] std::span<const NodeId> destinations_view() const noexcept { return destinations_; }

  [[nodiscard]] EdgeId get_unchecked_degree(NodeId src) const noexcept {
    return offsets_[src + 1] - offsets_[src];
  }
  [[nodiscard]] std::pair<EdgeId, EdgeId> get_unchecked_minmax_edge_ids(NodeId src) const noexcept {
    return {offsets_[src], offsets_[src + 1]};
  }
  [[nodiscard]] std::span<const NodeId> get_unchecked_neighbours(NodeId src) const noexcept {
    return std::span<const NodeId>(destinations_).subspan(
        static_cast<std::size_t>(offsets_[src]),
        static_cast<std::size_t>(offsets_[src + 1] - offsets_[src]));
  }
  [[nodiscard]] NodeId get_unchecked_destination(EdgeId edge) const noexcept {
    return destinations_[static_cast<std::size_t>(edge)];
  }
  // Binary search over the offsets.
  [[nodiscard]] NodeId get_unchecked_source(EdgeId edge) const noexcept;

  // First edge id with (src, dst), or the position where it would be.
  [[nodiscard]] EdgeId get_unchecked_edge_id_lower_bound(NodeId src, NodeId dst) const noexcept;

  [[nodiscard]] EdgeId degree(NodeId src) const;
  [[nodiscard]] std::span<const NodeId> neighbours(NodeId src) const;
  [[nodiscard]] NodePair endpoints(EdgeId edge) const;
  [[nodiscard]] bool has_edge(NodeId src, NodeId dst) const;
  // First edge id from src to dst; nullopt when there is none.
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId src, NodeId dst) const;

  // Binary dump / reload of the two arrays (little-endian host layout).
  void dump(std::ostream& os) const;
  [[nodiscard]] static Csr load(std::istream& is);

  [[nodiscard]] std::uint64_t hash() const noexcept;
  [[nodiscard]] std::size_t memory_bytes() const noexcept {
    return offsets_.size() * sizeof(EdgeId) + destinations_.size() * sizeof(NodeId);
  }

  friend bool operator==(const Csr& a, const Csr& b) {
    return a.offsets_ == b.offsets_ && a.destinations_ == b.destinations_;
  }

private:
  void check_node(NodeId node) const;

  std::vector<EdgeId> offsets_ {};
  std::vector<NodeId> destinations_ {};
};

} // namespace ensgraph::core
