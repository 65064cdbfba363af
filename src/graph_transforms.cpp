/*
  Graph transforms. Each returns a new Graph; payload-only changes copy the
  arrays, structural changes go back through build()/assemble().
*/
#include "ensgraph/core/graph.hpp"

#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

Graph Graph::drop_selfloops(const ParallelContext& ctx) const {
  auto edges = raw_edges(ctx);
  std::erase_if(edges, [](const RawEdge& e) { return e.src == e.dst; });
  return assemble(parts(), edges, ctx);
}

Graph Graph::add_selfloops(std::optional<std::string> edge_type, std::optional<Weight> weight,
                           const ParallelContext& ctx) const {
  if (has_edge_weights() && !weight) {
    throw MalformedInput("graph '" + name_ + "' is weighted, added self-loops need a weight");
  }
  if (!has_edge_weights() && weight) {
    throw MalformedInput("graph '" + name_ + "' is unweighted, added self-loops cannot carry a weight");
  }
  auto p = parts();
  EdgeTypeId loop_type = kNoType;
  if (edge_type) {
    if (!p.edge_type_vocabulary) p.edge_type_vocabulary.emplace();
    loop_type = p.edge_type_vocabulary->insert(*edge_type);
    if (loop_type == kNoType) throw MalformedInput("too many distinct edge types");
  }
  auto edges = raw_edges(ctx);
  std::uint64_t added = 0;
  for (NodeId u = 0; u < num_nodes(); ++u) {
    if (!csr_.has_edge(u, u)) {
      edges.push_back({u, u, loop_type, weight.value_or(1.0F)});
      ++added;
    }
  }
  ENSGRAPH_DEBUG("graph '", name_, "': adding ", added, " self-loops");
  return build(std::move(p), std::move(edges), false, false, false, ctx);
}

Graph Graph::set_all_edge_types(const std::string& edge_type, const ParallelContext& ctx) const {
  auto p = parts();
  p.edge_type_vocabulary = TypeVocabulary::from_keys({edge_type});
  auto edges = raw_edges(ctx);
  for (auto& e : edges) e.edge_type = 0;
  // Parallel edges that differed only by type collapse into one.
  return build(std::move(p), std::move(edges), false, false, true, ctx);
}

Graph Graph::set_all_node_types(const std::string& node_type) const {
  Graph g = *this;
  g.node_types_ = TypeAssignments::flat(TypeVocabulary::from_keys({node_type}),
                                        std::vector<NodeTypeId>(static_cast<std::size_t>(num_nodes()), 0));
  return g;
}

Graph Graph::remove_edge_weights() const {
  Graph g = *this;
  g.weights_.reset();
  return g;
}

Graph Graph::remove_edge_types(const ParallelContext& ctx) const {
  if (!has_edge_types()) return *this;
  auto p = parts();
  p.edge_type_vocabulary.reset();
  auto edges = raw_edges(ctx);
  for (auto& e : edges) e.edge_type = kNoType;
  return build(std::move(p), std::move(edges), false, false, true, ctx);
}

Graph Graph::remove_node_types() const {
  Graph g = *this;
  g.node_types_.reset();
  return g;
}

Graph Graph::to_directed() const {
  Graph g = *this;
  g.directed_ = true;
  g.compute_statistics({});
  return g;
}

Graph Graph::remap(const Graph& other, const ParallelContext& ctx) const {
  if (other.num_nodes() != num_nodes()) {
    throw MalformedInput("cannot remap graph '" + name_ + "' with " + std::to_string(num_nodes()) +
                         " nodes onto a graph with " + std::to_string(other.num_nodes()) + " nodes");
  }
  std::vector<NodeId> order;
  order.reserve(static_cast<std::size_t>(num_nodes()));
  for (const auto& key : other.nodes_.keys()) {
    auto id = nodes_.get(key);
    if (!id) throw MalformedInput("cannot remap: node '" + key + "' is missing from graph '" + name_ + "'");
    order.push_back(*id);
  }
  return remap_from_node_ids(order, ctx);
}

Graph Graph::remap_from_node_ids(std::span<const NodeId> node_ids, const ParallelContext& ctx) const {
  const auto n = static_cast<std::size_t>(num_nodes());
  if (node_ids.size() != n) {
    throw MalformedInput("remap needs " + std::to_string(n) + " node ids, got " + std::to_string(node_ids.size()));
  }
  std::vector<NodeId> new_id_of(n, kNodeNotPresent);
  for (std::size_t i = 0; i < n; ++i) {
    const auto old = node_ids[i];
    if (old >= n) throw InvalidNodeId(old, n);
    if (new_id_of[old] != kNodeNotPresent) {
      throw MalformedInput("node id " + std::to_string(old) + " appears twice in the remapping");
    }
    new_id_of[old] = static_cast<NodeId>(i);
  }

  auto p = parts();
  std::vector<std::string> keys;
  keys.reserve(n);
  std::vector<std::size_t> order(n);
  for (std::size_t i = 0; i < n; ++i) {
    keys.push_back(nodes_.translate(node_ids[i]));
    order[i] = node_ids[i];
  }
  p.nodes = NodeVocabulary::from_keys(std::move(keys));
  if (node_types_) p.node_types = node_types_->reordered(order);

  auto edges = raw_edges(ctx);
  for (auto& e : edges) {
    e.src = new_id_of[e.src];
    e.dst = new_id_of[e.dst];
  }
  return build(std::move(p), std::move(edges), false, false, false, ctx);
}

} // namespace ensgraph::core
