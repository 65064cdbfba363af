/*
  Graph construction.

  Every entry point reduces its input to a vector of RawEdge with dense ids,
  then build() sorts it by (src, dst, edge type), applies the self-loop and
  duplicate policies, and assemble() hands each edge to its final slot of a
  ConcurrentCsrBuilder from an OpenMP loop.
*/
#include "ensgraph/core/graph.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "ensgraph/core/csr_builder.hpp"
#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

namespace {

std::uint16_t insert_type(TypeVocabulary& vocabulary, const std::string& name) {
  const auto id = vocabulary.insert(name);
  if (id == kNoType) {
    throw MalformedInput("too many distinct types, at most " + std::to_string(kNoType) + " are supported");
  }
  return id;
}

NodeId insert_node(NodeVocabulary& vocabulary, const std::string& name) {
  const auto id = vocabulary.insert(name);
  if (id == kNodeNotPresent) {
    throw MalformedInput("too many distinct nodes, at most " + std::to_string(kNodeNotPresent) +
                         " are supported");
  }
  return id;
}

} // namespace

Graph Graph::build(Parts parts, std::vector<RawEdge> edges, bool add_reverse, bool skip_selfloops,
                   bool skip_duplicates, const ParallelContext& ctx) {
  if (add_reverse) {
    const auto n = edges.size();
    edges.reserve(2 * n);
    for (std::size_t i = 0; i < n; ++i) {
      const auto e = edges[i];
      if (e.src != e.dst) edges.push_back({e.dst, e.src, e.edge_type, e.weight});
    }
  }
  auto key_less = [](const RawEdge& a, const RawEdge& b) {
    if (a.src != b.src) return a.src < b.src;
    if (a.dst != b.dst) return a.dst < b.dst;
    return a.edge_type < b.edge_type;
  };
  if (!std::is_sorted(edges.begin(), edges.end(), key_less)) {
    // Stable, so that "first occurrence wins" for duplicates.
    std::stable_sort(edges.begin(), edges.end(), key_less);
  }
  std::size_t kept = 0;
  std::uint64_t dropped_loops = 0;
  std::uint64_t dropped_duplicates = 0;
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const auto& e = edges[i];
    if (skip_selfloops && e.src == e.dst) {
      ++dropped_loops;
      continue;
    }
    if (skip_duplicates && kept > 0) {
      const auto& prev = edges[kept - 1];
      if (prev.src == e.src && prev.dst == e.dst && prev.edge_type == e.edge_type) {
        ++dropped_duplicates;
        continue;
      }
    }
    edges[kept++] = e;
  }
  edges.resize(kept);
  if (dropped_loops > 0 || dropped_duplicates > 0) {
    ENSGRAPH_DEBUG("graph '", parts.name, "': dropped ", dropped_loops, " self-loops and ", dropped_duplicates,
                   " duplicate directed edges");
  }
  return assemble(std::move(parts), edges, ctx);
}

Graph Graph::assemble(Parts parts, std::span<const RawEdge> edges, const ParallelContext& ctx) {
  const auto n_nodes = static_cast<NodeId>(parts.nodes.size());
  const auto n_edges = static_cast<EdgeId>(edges.size());
  const auto m = static_cast<std::int64_t>(n_edges);

  if (parts.weighted) {
    std::int64_t first_bad = m;
#pragma omp parallel for reduction(min : first_bad) num_threads(ctx.threads())
    for (std::int64_t i = 0; i < m; ++i) {
      const auto w = edges[static_cast<std::size_t>(i)].weight;
      if (!std::isfinite(w) || w <= 0.0F) first_bad = std::min(first_bad, i);
    }
    if (first_bad < m) {
      const auto& e = edges[static_cast<std::size_t>(first_bad)];
      throw MalformedInput("edge (" + std::to_string(e.src) + ", " + std::to_string(e.dst) + ") has weight " +
                           std::to_string(e.weight) + ", weights must be finite and strictly positive");
    }
  }

  ConcurrentCsrBuilder builder(n_nodes, n_edges, parts.weighted, parts.edge_type_vocabulary.has_value());
#pragma omp parallel for schedule(static) num_threads(ctx.threads())
  for (std::int64_t i = 0; i < m; ++i) {
    const auto& e = edges[static_cast<std::size_t>(i)];
    builder.set(static_cast<EdgeId>(i), e.src, e.dst, e.weight, e.edge_type);
  }
  auto built = std::move(builder).build(ctx);

  Graph g;
  g.name_ = std::move(parts.name);
  g.directed_ = parts.directed;
  g.nodes_ = std::move(parts.nodes);
  g.csr_ = std::move(built.csr);
  g.weights_ = std::move(built.weights);
  g.node_types_ = std::move(parts.node_types);
  if (parts.edge_type_vocabulary) {
    g.edge_types_ = TypeAssignments::flat(std::move(*parts.edge_type_vocabulary), std::move(*built.edge_types));
  }
  g.compute_statistics(ctx);
  ENSGRAPH_INFO("built graph '", g.name_, "': ", g.num_nodes(), " nodes, ", g.num_directed_edges(),
                " directed edges", g.directed_ ? " (directed)" : " (undirected)");
  return g;
}

Graph Graph::from_unsorted_edges(std::span<const EdgeRecord> edges,
                                 std::optional<std::span<const NodeRecord>> nodes,
                                 const EdgeListOptions& options, const ParallelContext& ctx) {
  Parts parts;
  parts.name = options.name;
  parts.directed = options.directed;

  if (nodes) {
    TypeVocabulary node_type_vocabulary;
    std::vector<std::vector<NodeTypeId>> per_node;
    per_node.reserve(nodes->size());
    parts.nodes.reserve(nodes->size());
    bool any_type = false;
    for (const auto& record : *nodes) {
      if (parts.nodes.contains(record.name)) {
        throw MalformedInput("node '" + record.name + "' appears twice in the node list");
      }
      insert_node(parts.nodes, record.name);
      std::vector<NodeTypeId> ids;
      ids.reserve(record.node_types.size());
      for (const auto& t : record.node_types) ids.push_back(insert_type(node_type_vocabulary, t));
      any_type = any_type || !ids.empty();
      per_node.push_back(std::move(ids));
    }
    if (any_type) parts.node_types = TypeAssignments::from_lists(std::move(node_type_vocabulary), per_node);
  }

  const bool weighted = !edges.empty() && edges.front().weight.has_value();
  TypeVocabulary edge_type_vocabulary;
  bool typed = false;
  std::vector<RawEdge> raw;
  raw.reserve(edges.size());
  auto resolve = [&](const std::string& name) -> NodeId {
    if (!nodes) return insert_node(parts.nodes, name);
    auto id = parts.nodes.get(name);
    if (!id) throw MalformedInput("edge endpoint '" + name + "' is not in the node list");
    return *id;
  };
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const auto& record = edges[i];
    if (record.weight.has_value() != weighted) {
      throw MalformedInput("edge " + std::to_string(i) + " (" + record.src + ", " + record.dst +
                           "): either every edge carries a weight or none does");
    }
    RawEdge e {};
    e.src = resolve(record.src);
    e.dst = resolve(record.dst);
    e.edge_type = kNoType;
    if (record.edge_type) {
      typed = true;
      e.edge_type = insert_type(edge_type_vocabulary, *record.edge_type);
    }
    e.weight = record.weight.value_or(1.0F);
    raw.push_back(e);
  }
  if (typed) parts.edge_type_vocabulary = std::move(edge_type_vocabulary);
  parts.weighted = weighted;

  ENSGRAPH_DEBUG("graph '", parts.name, "': ", raw.size(), " input edges over ", parts.nodes.size(), " nodes");
  return build(std::move(parts), std::move(raw), !options.directed, options.skip_selfloops,
               options.skip_duplicates, ctx);
}

Graph Graph::from_sorted_edges(NodeVocabulary nodes, std::span<const SortedEdge> edges,
                               std::optional<TypeVocabulary> edge_types, const EdgeListOptions& options,
                               const ParallelContext& ctx) {
  Parts parts;
  parts.name = options.name;
  parts.directed = options.directed;
  parts.nodes = std::move(nodes);
  parts.edge_type_vocabulary = std::move(edge_types);
  parts.weighted = !edges.empty() && edges.front().weight.has_value();

  std::vector<RawEdge> raw;
  raw.reserve(edges.size());
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const auto& e = edges[i];
    if (e.weight.has_value() != parts.weighted) {
      throw MalformedInput("sorted edge " + std::to_string(i) + ": either every edge carries a weight or none does");
    }
    if (e.edge_type != kNoType && !parts.edge_type_vocabulary) {
      throw MalformedInput("sorted edge " + std::to_string(i) + " has an edge type but no edge type vocabulary was given");
    }
    if (i > 0) {
      const auto& p = edges[i - 1];
      const bool ordered = p.src != e.src ? p.src < e.src
                           : p.dst != e.dst ? p.dst < e.dst
                                            : p.edge_type <= e.edge_type;
      if (!ordered) {
        throw MalformedInput("sorted edges are out of order at position " + std::to_string(i) + ": (" +
                             std::to_string(p.src) + ", " + std::to_string(p.dst) + ") precedes (" +
                             std::to_string(e.src) + ", " + std::to_string(e.dst) + ")");
      }
    }
    raw.push_back({e.src, e.dst, e.edge_type, e.weight.value_or(1.0F)});
  }
  return build(std::move(parts), std::move(raw), false, options.skip_selfloops, options.skip_duplicates, ctx);
}

Graph Graph::from_integer_edges(NodeId num_nodes, std::span<const NodePair> edges,
                                const EdgeListOptions& options, const ParallelContext& ctx) {
  Parts parts;
  parts.name = options.name;
  parts.directed = options.directed;
  parts.nodes.reserve(num_nodes);
  for (NodeId i = 0; i < num_nodes; ++i) parts.nodes.insert(std::to_string(i));

  std::vector<RawEdge> raw;
  raw.reserve(edges.size());
  for (const auto& e : edges) {
    if (e.src >= num_nodes) throw InvalidNodeId(e.src, num_nodes);
    if (e.dst >= num_nodes) throw InvalidNodeId(e.dst, num_nodes);
    raw.push_back({e.src, e.dst, kNoType, 1.0F});
  }
  return build(std::move(parts), std::move(raw), !options.directed, options.skip_selfloops,
               options.skip_duplicates, ctx);
}

} // namespace ensgraph::core
