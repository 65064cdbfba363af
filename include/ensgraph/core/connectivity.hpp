/* Weak and strong connectivity. */
#pragma once

#include <cstdint>
#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// component_ids[v] is dense in [0, count). Components are numbered in order
// of their smallest node id.
struct ComponentsResult {
  std::vector<NodeId> component_ids {};
  NodeId count {0};
  NodeId min_size {0};
  NodeId max_size {0};
};

// Weakly connected components: union-find over every directed edge.
[[nodiscard]] ComponentsResult connected_components(const Graph& g);

// Frontier-parallel label propagation over an undirected graph; same
// partition and numbering as connected_components().
// Throws UnsupportedOnDirected.
[[nodiscard]] ComponentsResult parallel_connected_components(const Graph& g, const ParallelContext& ctx = {});

// Iterative Tarjan. Each inner vector is one component; unreachable
// singletons form their own component. Components come out in reverse
// topological order of the condensation.
[[nodiscard]] std::vector<std::vector<NodeId>> strongly_connected_components(const Graph& g);

} // namespace ensgraph::core
