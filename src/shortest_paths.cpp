/*
  shortest_paths: BFS and Dijkstra over the Graph CSR.

  Dijkstra keeps one queue entry per node through DijkstraQueue's
  decrease-key, so a node is settled exactly once. Both searches stop as soon
  as the optional destination is settled.
*/
#include "ensgraph/core/shortest_paths.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <vector>

#include "ensgraph/core/dijkstra_queue.hpp"
#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

namespace {
constexpr EdgeId kNoEdge = std::numeric_limits<EdgeId>::max();

ShortestPaths init_paths(const Graph& g, NodeId src, std::optional<NodeId> dst) {
  if (src >= g.num_nodes()) throw InvalidNodeId(src, g.num_nodes());
  if (dst && *dst >= g.num_nodes()) throw InvalidNodeId(*dst, g.num_nodes());
  ShortestPaths out;
  out.source = src;
  const auto n = static_cast<std::size_t>(g.num_nodes());
  out.distances.assign(n, std::numeric_limits<double>::infinity());
  out.predecessors.assign(n, kNodeNotPresent);
  out.via_edges.assign(n, kNoEdge);
  out.distances[src] = 0.0;
  return out;
}
} // namespace

ShortestPaths breadth_first_search(const Graph& g, NodeId src, std::optional<NodeId> dst) {
  auto out = init_paths(g, src, dst);
  const auto& csr = g.adjacency();
  std::deque<NodeId> frontier {src};
  while (!frontier.empty()) {
    const auto u = frontier.front();
    frontier.pop_front();
    if (dst && u == *dst) break;
    const auto [begin, end] = csr.get_unchecked_minmax_edge_ids(u);
    for (auto e = begin; e < end; ++e) {
      const auto v = csr.get_unchecked_destination(e);
      if (out.reached(v)) continue;
      out.distances[v] = out.distances[u] + 1.0;
      out.predecessors[v] = u;
      out.via_edges[v] = e;
      frontier.push_back(v);
    }
  }
  return out;
}

ShortestPaths dijkstra(const Graph& g, NodeId src, std::optional<NodeId> dst) {
  auto out = init_paths(g, src, dst);
  const auto& csr = g.adjacency();
  auto queue = DijkstraQueue<double>::with_capacity_from_root(g.num_nodes(), src);
  std::vector<std::uint8_t> settled(static_cast<std::size_t>(g.num_nodes()), 0);
  std::size_t settled_count = 0;
  while (auto entry = queue.pop_min()) {
    const auto [u, d_u] = *entry;
    settled[u] = 1;
    ++settled_count;
    if (dst && u == *dst) break;
    const auto [begin, end] = csr.get_unchecked_minmax_edge_ids(u);
    for (auto e = begin; e < end; ++e) {
      const auto v = csr.get_unchecked_destination(e);
      if (settled[v]) continue;
      const double candidate = d_u + static_cast<double>(g.get_unchecked_edge_weight(e));
      if (candidate < out.distances[v]) {
        out.distances[v] = candidate;
        out.predecessors[v] = u;
        out.via_edges[v] = e;
        queue.push(v, candidate);
      }
    }
  }
  ENSGRAPH_TRACE("dijkstra from ", src, " settled ", settled_count, " nodes");
  return out;
}

std::vector<NodeId> resolve_path(const ShortestPaths& paths, NodeId dst) {
  if (dst >= paths.distances.size()) throw InvalidNodeId(dst, paths.distances.size());
  std::vector<NodeId> path;
  if (!paths.reached(dst)) return path;
  for (auto v = dst; v != kNodeNotPresent; v = paths.predecessors[v]) {
    path.push_back(v);
    if (v == paths.source) break;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

} // namespace ensgraph::core
