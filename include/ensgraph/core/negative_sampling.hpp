/* Negative edge sampling from the complement of the edge set. */
#pragma once

#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/options.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Number of (src, dst) pairs that are not edges. Undirected graphs count
// unordered pairs; self-loops count only when allowed.
[[nodiscard]] std::uint64_t count_possible_negative_edges(const Graph& g, bool allow_selfloops);

// `options.count` distinct non-edges, sorted by (src, dst). Undirected
// graphs yield pairs with src <= dst.
//
// Pairs are drawn uniformly, or with both endpoints proportional to their
// degree. Sparse requests use seeded rejection sampling in fixed-size
// batches, so the result depends on the seed and not on the thread count.
// Dense uniform requests on small graphs sample the enumerated complement.
//
// Throws OutOfCapacity when count exceeds the possible negatives, or when
// rejection sampling exhausts count * max_attempts_factor draws (degree
// weighting can make negatives unreachable).
[[nodiscard]] std::vector<NodePair> sample_negative_edges(const Graph& g, const NegativeSamplingOptions& options,
                                                          const ParallelContext& ctx = {});

} // namespace ensgraph::core
