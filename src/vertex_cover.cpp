#include "ensgraph/core/vertex_cover.hpp"

#include <cstdint>
#include <vector>

#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

std::vector<NodeId> approximated_vertex_cover(const Graph& g) {
  const auto& csr = g.adjacency();
  std::vector<std::uint8_t> covered(static_cast<std::size_t>(g.num_nodes()), 0);
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    if (covered[u]) continue;
    for (auto v : csr.get_unchecked_neighbours(u)) {
      if (covered[v]) continue;
      // A self-loop is covered by its single endpoint.
      covered[u] = 1;
      covered[v] = 1;
      break;
    }
  }
  std::vector<NodeId> cover;
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    if (covered[u]) cover.push_back(u);
  }
  ENSGRAPH_DEBUG("graph '", g.name(), "': vertex cover of ", cover.size(), " nodes");
  return cover;
}

} // namespace ensgraph::core
