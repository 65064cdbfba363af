/* Spanning forests (Kruskal) and the parallel randomized arborescence. */
#pragma once

#include <span>
#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/options.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Tree edges of a spanning forest. Edge directions are ignored, so directed
// graphs yield a spanning forest of their weak components.
// edges.size() == num_nodes - num_components.
struct SpanningForest {
  std::vector<NodePair> edges {};
  NodeId num_components {0};
};

// Edges in edge id order. Edges whose type is undesired go last (or are
// skipped, see SpanningTreeOptions).
[[nodiscard]] SpanningForest spanning_arborescence_kruskal(const Graph& g, const SpanningTreeOptions& options = {});

// Edges in increasing weight order, ties by edge id.
[[nodiscard]] SpanningForest minimum_spanning_forest(const Graph& g);

// Edges in an order drawn from options.seed.
[[nodiscard]] SpanningForest random_spanning_arborescence_kruskal(const Graph& g, const SpanningTreeOptions& options);

// Randomized level-synchronous construction over an undirected graph.
// parents[v] is the parent of v; roots are their own parent. Every
// component gets one root (its smallest node id) and the seed picks the
// parent of each node among its candidates on the previous level, so the
// result depends on the seed but not on the thread count.
// With include_all_edge_types, undesired edge types lose ties against other
// edges on the same level; otherwise they are never used.
// Throws UnsupportedOnDirected.
[[nodiscard]] std::vector<NodeId> spanning_arborescence(const Graph& g, const SpanningTreeOptions& options,
                                                        const ParallelContext& ctx = {});

// (parent, child) for every non-root entry of a parent vector.
[[nodiscard]] std::vector<NodePair> spanning_tree_edges(std::span<const NodeId> parents);

} // namespace ensgraph::core
