/* Single-source shortest paths: BFS (hop counts) and weighted Dijkstra. */
#pragma once

#include <limits>
#include <optional>
#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Shortest path tree from `source`.
// - distances[v] is +infinity for unreached nodes.
// - predecessors[v] / via_edges[v] give the last hop; kNodeNotPresent and
//   max EdgeId for the source and unreached nodes.
struct ShortestPaths {
  NodeId source {0};
  std::vector<double> distances {};
  std::vector<NodeId> predecessors {};
  std::vector<EdgeId> via_edges {};

  [[nodiscard]] bool reached(NodeId node) const noexcept {
    return node < distances.size() && distances[node] != std::numeric_limits<double>::infinity();
  }
};

// Every edge counts as one hop. Stops early once `dst` is reached.
// Throws InvalidNodeId.
[[nodiscard]] ShortestPaths breadth_first_search(const Graph& g, NodeId src,
                                                 std::optional<NodeId> dst = std::nullopt);

// Edge weights as lengths (1.0 on unweighted graphs). Among parallel edges
// of equal length the smallest edge id is kept. Throws InvalidNodeId.
[[nodiscard]] ShortestPaths dijkstra(const Graph& g, NodeId src, std::optional<NodeId> dst = std::nullopt);

// Nodes from the source to `dst`; empty when `dst` was not reached.
[[nodiscard]] std::vector<NodeId> resolve_path(const ShortestPaths& paths, NodeId dst);

} // namespace ensgraph::core
