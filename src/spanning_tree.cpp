/*
  spanning_tree: Kruskal variants over a union-find and the level-synchronous
  randomized arborescence.

  The arborescence expands all roots' BFS levels in parallel; every newly
  reached node keeps the candidate parent with the smallest seeded key,
  claimed with an atomic fetch-min, so concurrent claims commute.
*/
#include "ensgraph/core/spanning_tree.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"
#include "ensgraph/core/random.hpp"
#include "ensgraph/core/union_find.hpp"

namespace ensgraph::core {

namespace {

bool is_undesired(const Graph& g, EdgeId e, const SpanningTreeOptions& options) {
  if (options.undesired_edge_types.empty()) return false;
  const auto t = g.get_unchecked_edge_type(e);
  return std::find(options.undesired_edge_types.begin(), options.undesired_edge_types.end(), t) !=
         options.undesired_edge_types.end();
}

// Candidate edges for Kruskal: one direction per undirected edge, no
// self-loops, undesired edges dropped unless options allow them.
std::vector<EdgeId> candidate_edges(const Graph& g, const SpanningTreeOptions& options,
                                    std::vector<std::uint8_t>& undesired) {
  const auto& csr = g.adjacency();
  std::vector<EdgeId> out;
  out.reserve(static_cast<std::size_t>(g.num_edges()));
  undesired.clear();
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    const auto [begin, end] = csr.get_unchecked_minmax_edge_ids(u);
    for (auto e = begin; e < end; ++e) {
      const auto v = csr.get_unchecked_destination(e);
      if (u == v || (!g.is_directed() && v < u)) continue;
      const bool bad = is_undesired(g, e, options);
      if (bad && !options.include_all_edge_types) continue;
      out.push_back(e);
      undesired.push_back(bad ? 1 : 0);
    }
  }
  return out;
}

SpanningForest kruskal(const Graph& g, std::span<const EdgeId> order) {
  const auto& csr = g.adjacency();
  UnionFind uf(g.num_nodes());
  SpanningForest forest;
  forest.edges.reserve(g.num_nodes() > 0 ? g.num_nodes() - 1 : 0);
  for (auto e : order) {
    if (uf.num_components() <= 1) break;
    const auto src = csr.get_unchecked_source(e);
    const auto dst = csr.get_unchecked_destination(e);
    if (uf.unite(src, dst)) forest.edges.push_back({src, dst});
  }
  forest.num_components = uf.num_components();
  ENSGRAPH_DEBUG("graph '", g.name(), "': spanning forest with ", forest.edges.size(), " edges over ",
                 forest.num_components, " components");
  return forest;
}

// Stable partition putting desired edges first.
void defer_undesired(std::vector<EdgeId>& edges, const std::vector<std::uint8_t>& undesired) {
  std::vector<EdgeId> tail;
  std::size_t kept = 0;
  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (undesired[i]) {
      tail.push_back(edges[i]);
    } else {
      edges[kept++] = edges[i];
    }
  }
  std::copy(tail.begin(), tail.end(), edges.begin() + static_cast<std::ptrdiff_t>(kept));
}

} // namespace

SpanningForest spanning_arborescence_kruskal(const Graph& g, const SpanningTreeOptions& options) {
  std::vector<std::uint8_t> undesired;
  auto edges = candidate_edges(g, options, undesired);
  defer_undesired(edges, undesired);
  return kruskal(g, edges);
}

SpanningForest minimum_spanning_forest(const Graph& g) {
  std::vector<std::uint8_t> undesired;
  auto edges = candidate_edges(g, {}, undesired);
  std::stable_sort(edges.begin(), edges.end(), [&g](EdgeId a, EdgeId b) {
    return g.get_unchecked_edge_weight(a) < g.get_unchecked_edge_weight(b);
  });
  return kruskal(g, edges);
}

SpanningForest random_spanning_arborescence_kruskal(const Graph& g, const SpanningTreeOptions& options) {
  std::vector<std::uint8_t> undesired;
  auto edges = candidate_edges(g, options, undesired);
  std::vector<std::pair<std::uint64_t, EdgeId>> keyed(edges.size());
  for (std::size_t i = 0; i < edges.size(); ++i) {
    // Undesired edges sort after every other edge.
    const auto key = (splitmix64(options.seed ^ splitmix64(edges[i])) >> 1) |
                     (static_cast<std::uint64_t>(undesired[i]) << 63);
    keyed[i] = {key, edges[i]};
  }
  std::sort(keyed.begin(), keyed.end());
  for (std::size_t i = 0; i < edges.size(); ++i) edges[i] = keyed[i].second;
  return kruskal(g, edges);
}

std::vector<NodeId> spanning_arborescence(const Graph& g, const SpanningTreeOptions& options,
                                          const ParallelContext& ctx) {
  if (g.is_directed()) {
    throw UnsupportedOnDirected("spanning arborescence needs an undirected graph, '" + g.name() + "' is directed");
  }
  const auto& csr = g.adjacency();
  const auto n = static_cast<std::size_t>(g.num_nodes());
  constexpr std::uint64_t kUnclaimed = std::numeric_limits<std::uint64_t>::max();
  // Smaller frontiers run on the calling thread.
  constexpr std::int64_t kParallelFrontier = 256;

  std::vector<NodeId> parents(n, kNodeNotPresent);
  std::vector<std::atomic<std::uint64_t>> claim(n);
  for (auto& c : claim) c.store(kUnclaimed, std::memory_order_relaxed);

  // Roots are the smallest node of each component, found through a scan
  // that seeds a new traversal on every node still without parent.
  std::size_t levels = 0;
  std::size_t roots = 0;
  for (NodeId root = 0; root < n; ++root) {
    if (parents[root] != kNodeNotPresent) continue;
    parents[root] = root;
    ++roots;
    // Isolated nodes are complete trees already.
    if (csr.get_unchecked_degree(root) == 0) continue;
    std::vector<NodeId> frontier {root};
    while (!frontier.empty()) {
      ++levels;
      const auto f = static_cast<std::int64_t>(frontier.size());
      // Claim phase: key = (undesired, seeded hash of the edge, parent id).
      const bool parallel = f >= kParallelFrontier;
#pragma omp parallel for if(parallel) schedule(dynamic, 64) num_threads(ctx.threads())
      for (std::int64_t i = 0; i < f; ++i) {
        const auto u = frontier[static_cast<std::size_t>(i)];
        const auto [begin, end] = csr.get_unchecked_minmax_edge_ids(u);
        for (auto e = begin; e < end; ++e) {
          const auto v = csr.get_unchecked_destination(e);
          if (parents[v] != kNodeNotPresent) continue;
          std::uint64_t undesired = 0;
          if (is_undesired(g, e, options)) {
            if (!options.include_all_edge_types) continue;
            undesired = 1;
          }
          const auto mix = splitmix64(options.seed ^ splitmix64((static_cast<std::uint64_t>(u) << 32) | v));
          const std::uint64_t key = (undesired << 63) | ((mix >> 33) << 32) | u;
          auto current = claim[v].load(std::memory_order_relaxed);
          while (key < current && !claim[v].compare_exchange_weak(current, key, std::memory_order_relaxed)) {
          }
        }
      }
      // Settle phase: every claimed node joins the next level.
      std::vector<NodeId> next;
#pragma omp parallel if(parallel) num_threads(ctx.threads())
      {
        std::vector<NodeId> local;
#pragma omp for schedule(dynamic, 64) nowait
        for (std::int64_t i = 0; i < f; ++i) {
          const auto u = frontier[static_cast<std::size_t>(i)];
          for (auto v : csr.get_unchecked_neighbours(u)) {
            const auto key = claim[v].load(std::memory_order_relaxed);
            // Only the winning parent settles v, so each v is added once.
            if (key != kUnclaimed && static_cast<NodeId>(key & 0xffffffffULL) == u && parents[v] == kNodeNotPresent) {
              local.push_back(v);
            }
          }
        }
#pragma omp critical(ensgraph_arborescence_frontier)
        next.insert(next.end(), local.begin(), local.end());
      }
      // Parallel edges to the winner may list v more than once.
      std::sort(next.begin(), next.end());
      next.erase(std::unique(next.begin(), next.end()), next.end());
      for (auto v : next) parents[v] = static_cast<NodeId>(claim[v].load(std::memory_order_relaxed) & 0xffffffffULL);
      frontier = std::move(next);
    }
  }
  ENSGRAPH_INFO("graph '", g.name(), "': spanning arborescence with ", n - roots, " edges, ", roots, " roots, ",
                levels, " levels");
  return parents;
}

std::vector<NodePair> spanning_tree_edges(std::span<const NodeId> parents) {
  std::vector<NodePair> out;
  for (std::size_t v = 0; v < parents.size(); ++v) {
    if (parents[v] != static_cast<NodeId>(v) && parents[v] != kNodeNotPresent) {
      out.push_back({parents[v], static_cast<NodeId>(v)});
    }
  }
  return out;
}

} // namespace ensgraph::core
