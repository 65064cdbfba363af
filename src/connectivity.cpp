/*
  Connectivity: union-find weak components, frontier-parallel label
  propagation and an explicit-stack Tarjan for strong components.
*/
#include "ensgraph/core/connectivity.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"
#include "ensgraph/core/union_find.hpp"

namespace ensgraph::core {

namespace {

// Dense ids in order of first appearance of each representative.
ComponentsResult densify(const std::vector<NodeId>& representative) {
  ComponentsResult out;
  const auto n = representative.size();
  out.component_ids.assign(n, kNodeNotPresent);
  std::vector<NodeId> dense_of(n, kNodeNotPresent);
  std::vector<NodeId> sizes;
  for (std::size_t v = 0; v < n; ++v) {
    auto& id = dense_of[representative[v]];
    if (id == kNodeNotPresent) {
      id = static_cast<NodeId>(sizes.size());
      sizes.push_back(0);
    }
    out.component_ids[v] = id;
    ++sizes[id];
  }
  out.count = static_cast<NodeId>(sizes.size());
  if (!sizes.empty()) {
    const auto [lo, hi] = std::minmax_element(sizes.begin(), sizes.end());
    out.min_size = *lo;
    out.max_size = *hi;
  }
  return out;
}

} // namespace

ComponentsResult connected_components(const Graph& g) {
  const auto& csr = g.adjacency();
  UnionFind uf(g.num_nodes());
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    for (auto v : csr.get_unchecked_neighbours(u)) uf.unite(u, v);
  }
  std::vector<NodeId> representative(static_cast<std::size_t>(g.num_nodes()));
  for (NodeId v = 0; v < g.num_nodes(); ++v) representative[v] = uf.find(v);
  auto out = densify(representative);
  ENSGRAPH_INFO("graph '", g.name(), "': ", out.count, " connected components, sizes in [", out.min_size, ", ",
                out.max_size, "]");
  return out;
}

ComponentsResult parallel_connected_components(const Graph& g, const ParallelContext& ctx) {
  if (g.is_directed()) {
    throw UnsupportedOnDirected("parallel connected components need an undirected graph, '" + g.name() +
                                "' is directed");
  }
  const auto& csr = g.adjacency();
  const auto n = static_cast<std::int64_t>(g.num_nodes());
  // Every node converges to the smallest node id of its component.
  std::vector<std::atomic<NodeId>> label(static_cast<std::size_t>(n));
  for (std::int64_t v = 0; v < n; ++v) label[static_cast<std::size_t>(v)].store(static_cast<NodeId>(v), std::memory_order_relaxed);

  std::vector<NodeId> frontier(static_cast<std::size_t>(n));
  for (std::int64_t v = 0; v < n; ++v) frontier[static_cast<std::size_t>(v)] = static_cast<NodeId>(v);
  std::vector<std::uint8_t> queued(static_cast<std::size_t>(n), 0);
  std::size_t rounds = 0;
  while (!frontier.empty()) {
    ++rounds;
    std::fill(queued.begin(), queued.end(), 0);
    std::vector<NodeId> next;
    const auto f = static_cast<std::int64_t>(frontier.size());
#pragma omp parallel num_threads(ctx.threads())
    {
      std::vector<NodeId> local;
#pragma omp for schedule(dynamic, 256) nowait
      for (std::int64_t i = 0; i < f; ++i) {
        const auto u = frontier[static_cast<std::size_t>(i)];
        const auto lu = label[u].load(std::memory_order_relaxed);
        for (auto v : csr.get_unchecked_neighbours(u)) {
          auto lv = label[v].load(std::memory_order_relaxed);
          while (lu < lv) {
            if (label[v].compare_exchange_weak(lv, lu, std::memory_order_relaxed)) {
              std::atomic_ref<std::uint8_t> flag(queued[v]);
              if (flag.exchange(1, std::memory_order_relaxed) == 0) local.push_back(v);
              break;
            }
          }
        }
      }
#pragma omp critical(ensgraph_components_frontier)
      next.insert(next.end(), local.begin(), local.end());
    }
    frontier = std::move(next);
  }

  std::vector<NodeId> representative(static_cast<std::size_t>(n));
  for (std::int64_t v = 0; v < n; ++v) {
    representative[static_cast<std::size_t>(v)] = label[static_cast<std::size_t>(v)].load(std::memory_order_relaxed);
  }
  auto out = densify(representative);
  ENSGRAPH_INFO("graph '", g.name(), "': ", out.count, " connected components after ", rounds,
                " propagation rounds");
  return out;
}

std::vector<std::vector<NodeId>> strongly_connected_components(const Graph& g) {
  const auto& csr = g.adjacency();
  const auto n = g.num_nodes();
  constexpr NodeId kUnvisited = kNodeNotPresent;
  std::vector<NodeId> index(n, kUnvisited);
  std::vector<NodeId> lowlink(n, 0);
  std::vector<std::uint8_t> on_stack(n, 0);
  std::vector<NodeId> stack;
  // (node, next edge to explore)
  std::vector<std::pair<NodeId, EdgeId>> call_stack;
  std::vector<std::vector<NodeId>> components;
  NodeId next_index = 0;

  for (NodeId root = 0; root < n; ++root) {
    if (index[root] != kUnvisited) continue;
    index[root] = lowlink[root] = next_index++;
    stack.push_back(root);
    on_stack[root] = 1;
    call_stack.emplace_back(root, csr.get_unchecked_minmax_edge_ids(root).first);

    while (!call_stack.empty()) {
      auto& [u, e] = call_stack.back();
      const auto end = csr.get_unchecked_minmax_edge_ids(u).second;
      if (e < end) {
        const auto v = csr.get_unchecked_destination(e);
        ++e;
        if (index[v] == kUnvisited) {
          index[v] = lowlink[v] = next_index++;
          stack.push_back(v);
          on_stack[v] = 1;
          call_stack.emplace_back(v, csr.get_unchecked_minmax_edge_ids(v).first);
        } else if (on_stack[v]) {
          lowlink[u] = std::min(lowlink[u], index[v]);
        }
        continue;
      }
      const auto done = u;
      call_stack.pop_back();
      if (!call_stack.empty()) {
        const auto parent = call_stack.back().first;
        lowlink[parent] = std::min(lowlink[parent], lowlink[done]);
      }
      if (lowlink[done] == index[done]) {
        std::vector<NodeId> component;
        NodeId w = kNodeNotPresent;
        do {
          w = stack.back();
          stack.pop_back();
          on_stack[w] = 0;
          component.push_back(w);
        } while (w != done);
        components.push_back(std::move(component));
      }
    }
  }
  ENSGRAPH_INFO("graph '", g.name(), "': ", components.size(), " strongly connected components");
  return components;
}

} // namespace ensgraph::core
