/* 2-approximated vertex cover. */
#pragma once

#include <vector>

#include "ensgraph/core/graph.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Both endpoints of a greedy maximal matching, scanned in edge id order.
// Every edge has at least one endpoint in the result, which is at most
// twice the size of a minimum cover. Sorted ascending.
[[nodiscard]] std::vector<NodeId> approximated_vertex_cover(const Graph& g);

} // namespace ensgraph::core
