/*
  ConcurrentCsrBuilder: producers write edges into disjoint, pre-computed
  slots; build() verifies the slots and derives the offsets in parallel.

  Unwritten slots are detected through the kNodeNotPresent fill of the source
  array, so the write path carries no counters or locks.
*/
#include "ensgraph/core/csr_builder.hpp"

#include <string>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

ConcurrentCsrBuilder::ConcurrentCsrBuilder(NodeId num_nodes, EdgeId num_edges, bool weighted, bool typed)
    : num_nodes_(num_nodes),
      num_edges_(num_edges),
      sources_(static_cast<std::size_t>(num_edges), kNodeNotPresent),
      destinations_(static_cast<std::size_t>(num_edges), kNodeNotPresent) {
  if (num_nodes == kNodeNotPresent) {
    throw MalformedInput("number of nodes exceeds the node id space");
  }
  if (weighted) weights_.emplace(static_cast<std::size_t>(num_edges), 1.0F);
  if (typed) edge_types_.emplace(static_cast<std::size_t>(num_edges), kNoType);
#ifndef NDEBUG
  written_ = std::make_unique<std::atomic<std::uint8_t>[]>(static_cast<std::size_t>(num_edges));
  for (EdgeId i = 0; i < num_edges; ++i) written_[i].store(0, std::memory_order_relaxed);
#endif
}

void ConcurrentCsrBuilder::set(EdgeId slot, NodeId src, NodeId dst, Weight weight,
                               EdgeTypeId edge_type) noexcept {
  if (slot >= num_edges_) {
    out_of_range_write_.store(true, std::memory_order_relaxed);
    return;
  }
#ifndef NDEBUG
  auto previous = written_[slot].exchange(1, std::memory_order_relaxed);
  assert(previous == 0 && "edge slot written twice");
  (void)previous;
#endif
  const auto i = static_cast<std::size_t>(slot);
  sources_.write_unchecked(i, src);
  destinations_.write_unchecked(i, dst);
  if (weights_) weights_->write_unchecked(i, weight);
  if (edge_types_) edge_types_->write_unchecked(i, edge_type);
}

CsrBuildResult ConcurrentCsrBuilder::build(const ParallelContext& ctx) && {
  if (out_of_range_write_.load(std::memory_order_acquire)) {
    throw IncompleteBuild("an edge slot outside [0, " + std::to_string(num_edges_) + ") was written");
  }
  const auto m = static_cast<std::int64_t>(num_edges_);
  const int threads = ctx.threads();

  std::int64_t missing = 0;
  std::int64_t bad_ids = 0;
  std::int64_t unsorted = 0;
#pragma omp parallel for num_threads(threads) schedule(static) reduction(+ : missing, bad_ids, unsorted)
  for (std::int64_t i = 0; i < m; ++i) {
    const auto s = sources_.read_unchecked(static_cast<std::size_t>(i));
    const auto d = destinations_.read_unchecked(static_cast<std::size_t>(i));
    if (s == kNodeNotPresent) {
      ++missing;
      continue;
    }
    if (s >= num_nodes_ || d >= num_nodes_) {
      ++bad_ids;
      continue;
    }
    if (i > 0) {
      const auto ps = sources_.read_unchecked(static_cast<std::size_t>(i - 1));
      const auto pd = destinations_.read_unchecked(static_cast<std::size_t>(i - 1));
      if (ps != kNodeNotPresent && (ps > s || (ps == s && pd > d))) ++unsorted;
    }
  }
  if (missing > 0) {
    throw IncompleteBuild(std::to_string(missing) + " of " + std::to_string(num_edges_) +
                          " edge slots were never written");
  }
  if (bad_ids > 0) {
    throw MalformedInput(std::to_string(bad_ids) + " edges reference node ids outside [0, " +
                         std::to_string(num_nodes_) + ")");
  }
  if (unsorted > 0) {
    throw MalformedInput(std::to_string(unsorted) + " edge slots break the (src, dst) ordering");
  }

  // Each edge that starts a new source run fills the offsets of the nodes
  // between the previous source and its own; the ranges are disjoint.
  std::vector<EdgeId> offsets(static_cast<std::size_t>(num_nodes_) + 1, 0);
#pragma omp parallel for num_threads(threads) schedule(static)
  for (std::int64_t i = 0; i < m; ++i) {
    const auto s = sources_.read_unchecked(static_cast<std::size_t>(i));
    const std::int64_t prev = i == 0 ? -1 : static_cast<std::int64_t>(sources_.read_unchecked(static_cast<std::size_t>(i - 1)));
    for (std::int64_t u = prev + 1; u <= static_cast<std::int64_t>(s); ++u) {
      offsets[static_cast<std::size_t>(u)] = static_cast<EdgeId>(i);
    }
  }
  const std::int64_t last = m == 0 ? -1 : static_cast<std::int64_t>(sources_.read_unchecked(static_cast<std::size_t>(m - 1)));
  for (auto u = static_cast<std::size_t>(last + 1); u < offsets.size(); ++u) {
    offsets[u] = num_edges_;
  }

  ENSGRAPH_DEBUG("built CSR with ", num_nodes_, " nodes and ", num_edges_, " directed edges");

  CsrBuildResult result{Csr(std::move(offsets), std::move(destinations_).release()), std::nullopt, std::nullopt};
  if (weights_) result.weights = std::move(*weights_).release();
  if (edge_types_) result.edge_types = std::move(*edge_types_).release();
  return result;
}

} // namespace ensgraph::core
