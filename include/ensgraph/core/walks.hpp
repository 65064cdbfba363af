/* Random walks: lazy, restartable sequences of node id walks. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/random.hpp"
#include "ensgraph/core/walks_parameters.hpp"

namespace ensgraph::core {

class WalkSequence;

// Samples walks over a graph that must outlive the walker and every
// sequence it returns.
//
// Walk i of a batch depends only on (random state, i), so sequences can be
// consumed in any order, from any thread, any number of times.
// A walk starting at a trap node is just [start]; a walk reaching a trap
// stops there. With no_traps, start nodes are redrawn until a node with
// outbound edges is found.
class RandomWalker {
public:
  RandomWalker(const Graph& graph, WalksParameters parameters);

  [[nodiscard]] const Graph& graph() const noexcept { return *graph_; }
  [[nodiscard]] const WalksParameters& parameters() const noexcept { return parameters_; }

  // quantity * iterations walks from seeded random starts.
  // Throws MalformedInput when quantity > 0 on a graph without nodes.
  [[nodiscard]] WalkSequence random_walks(std::uint64_t quantity) const;
  // iterations walks from every node (every non-trap node with no_traps).
  [[nodiscard]] WalkSequence complete_walks() const;

  // One walk from `start` driven by `seed`. Throws InvalidNodeId.
  [[nodiscard]] std::vector<NodeId> walk_from(NodeId start, std::uint64_t seed) const;

private:
  friend class WalkSequence;

  [[nodiscard]] NodeId draw_start(std::uint64_t seed) const;
  // Chooses an edge in the (possibly windowed) slice of `node`; `arrived`
  // is the edge used to reach it from `previous`, absent on the first step.
  [[nodiscard]] EdgeId step(NodeId node, NodeId previous, std::optional<EdgeId> arrived, Xorshift& rng,
                            std::vector<double>& scratch) const;

  const Graph* graph_;
  WalksParameters parameters_;
  bool uniform_ {false};
  std::vector<NodeId> sources_ {};
};

class WalkSequence {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::vector<NodeId>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    iterator() = default;
    iterator(const WalkSequence* sequence, std::uint64_t index) : sequence_(sequence), index_(index) {}

    reference operator*() const;
    pointer operator->() const { return &**this; }
    iterator& operator++() {
      ++index_;
      cached_ = false;
      return *this;
    }
    iterator operator++(int) {
      auto copy = *this;
      ++*this;
      return copy;
    }
    friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.index_ == b.index_; }

  private:
    const WalkSequence* sequence_ {nullptr};
    std::uint64_t index_ {0};
    mutable bool cached_ {false};
    mutable value_type walk_ {};
  };

  [[nodiscard]] std::uint64_t size() const noexcept { return quantity_ * walker_.parameters().iterations(); }
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  // Throws std::out_of_range when i >= size().
  [[nodiscard]] std::vector<NodeId> at(std::uint64_t i) const;

  [[nodiscard]] iterator begin() const { return iterator(this, 0); }
  [[nodiscard]] iterator end() const { return iterator(this, size()); }

  // Materializes every walk in parallel.
  [[nodiscard]] std::vector<std::vector<NodeId>> collect(const ParallelContext& ctx = {}) const;

private:
  friend class RandomWalker;

  WalkSequence(RandomWalker walker, std::uint64_t quantity, bool complete)
      : walker_(std::move(walker)), quantity_(quantity), complete_(complete) {}

  [[nodiscard]] std::vector<NodeId> walk_at(std::uint64_t i) const;

  RandomWalker walker_;
  std::uint64_t quantity_;
  bool complete_;
};

} // namespace ensgraph::core
