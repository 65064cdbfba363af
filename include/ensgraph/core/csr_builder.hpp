/* Lock-free CSR construction into pre-computed edge slots. */
#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

#include "ensgraph/core/csr.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Fixed arena of slots addressed by a pre-computed index.
//
// Caller guarantees disjoint writes: two threads never write the same index
// concurrently, and no thread reads an index another thread may still be
// writing. Distinct elements are distinct memory locations, so disjoint
// writes need no synchronization; the join at the end of the parallel region
// publishes them.
template <typename T>
class DisjointSlots {
  static_assert(!std::is_same_v<T, bool>, "bit-packed storage cannot be written disjointly");

public:
  DisjointSlots() = default;
  DisjointSlots(std::size_t n, const T& fill) : data_(n, fill) {}

  [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

  void write_unchecked(std::size_t index, const T& value) noexcept { data_[index] = value; }
  [[nodiscard]] const T& read_unchecked(std::size_t index) const noexcept { return data_[index]; }

  [[nodiscard]] std::vector<T> release() && noexcept { return std::move(data_); }

private:
  std::vector<T> data_ {};
};

struct CsrBuildResult {
  Csr csr;
  std::optional<std::vector<Weight>> weights;
  std::optional<std::vector<EdgeTypeId>> edge_types;
};

// Given the final node and edge counts, producers write every edge directly
// into its slot. Slots must be assigned so that (src, dst) is non-decreasing
// in slot order (for example from a prefix sum over sorted pairs).
//
// Contract: every slot in [0, num_edges) is written exactly once before
// build(). Concurrent set() calls on distinct slots are safe. Writing the same
// slot twice is a programming error caught by assertions in debug builds.
class ConcurrentCsrBuilder {
public:
  ConcurrentCsrBuilder(NodeId num_nodes, EdgeId num_edges, bool weighted, bool typed);

  ConcurrentCsrBuilder(const ConcurrentCsrBuilder&) = delete;
  ConcurrentCsrBuilder& operator=(const ConcurrentCsrBuilder&) = delete;

  [[nodiscard]] NodeId num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] EdgeId num_edges() const noexcept { return num_edges_; }

  // Out-of-range slots are recorded and reported by build().
  void set(EdgeId slot, NodeId src, NodeId dst, Weight weight = 1.0F,
           EdgeTypeId edge_type = kNoType) noexcept;

  // Validates completeness and ordering, then derives the offsets.
  // Throws IncompleteBuild when a slot is missing or an out-of-range slot
  // was written, MalformedInput on out-of-range node ids or unsorted slots.
  [[nodiscard]] CsrBuildResult build(const ParallelContext& ctx = {}) &&;

private:
  NodeId num_nodes_;
  EdgeId num_edges_;
  DisjointSlots<NodeId> sources_;
  DisjointSlots<NodeId> destinations_;
  std::optional<DisjointSlots<Weight>> weights_;
  std::optional<DisjointSlots<EdgeTypeId>> edge_types_;
  std::atomic<bool> out_of_range_write_ {false};
#ifndef NDEBUG
  std::unique_ptr<std::atomic<std::uint8_t>[]> written_;
#endif
};

} // namespace ensgraph::core
