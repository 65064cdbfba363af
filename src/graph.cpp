/*
  Graph: read-side queries, statistics and structural hash.
*/
#include "ensgraph/core/graph.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"

namespace ensgraph::core {

void Graph::compute_statistics(const ParallelContext& ctx) {
  const auto n = static_cast<std::int64_t>(num_nodes());
  EdgeId loops = 0;
  NodeId traps = 0;
  EdgeId min_deg = n == 0 ? 0 : csr_.num_edges();
  EdgeId max_deg = 0;
#pragma omp parallel for reduction(+ : loops, traps) reduction(min : min_deg) reduction(max : max_deg) num_threads(ctx.threads())
  for (std::int64_t u = 0; u < n; ++u) {
    const auto src = static_cast<NodeId>(u);
    const auto neigh = csr_.get_unchecked_neighbours(src);
    const auto deg = static_cast<EdgeId>(neigh.size());
    if (deg == 0) ++traps;
    min_deg = std::min(min_deg, deg);
    max_deg = std::max(max_deg, deg);
    // Parallel self-loops are adjacent in the sorted slice.
    auto lo = std::lower_bound(neigh.begin(), neigh.end(), src);
    auto hi = std::upper_bound(lo, neigh.end(), src);
    loops += static_cast<EdgeId>(hi - lo);
  }
  num_selfloops_ = loops;
  num_traps_ = traps;
  min_degree_ = min_deg;
  max_degree_ = max_deg;

  if (!directed_) {
    num_singletons_ = traps;
    return;
  }
  // A directed singleton has neither outbound nor inbound edges.
  std::vector<std::uint8_t> has_inbound(static_cast<std::size_t>(num_nodes()), 0);
  for (auto d : csr_.destinations_view()) has_inbound[d] = 1;
  NodeId singletons = 0;
  for (NodeId u = 0; u < num_nodes(); ++u) {
    if (csr_.get_unchecked_degree(u) == 0 && !has_inbound[u]) ++singletons;
  }
  num_singletons_ = singletons;
}

EdgeId Graph::num_edges() const noexcept {
  if (directed_) return num_directed_edges();
  return (num_directed_edges() - num_selfloops_) / 2 + num_selfloops_;
}

std::optional<std::span<const Weight>> Graph::weights_view() const noexcept {
  if (!weights_) return std::nullopt;
  return std::span<const Weight>(*weights_);
}

SuccinctCsr Graph::to_succinct_adjacency(const ParallelContext& ctx) const {
  return SuccinctCsr::from_csr(csr_, ctx);
}

void Graph::check_node(NodeId node) const {
  if (node >= num_nodes()) throw InvalidNodeId(node, num_nodes());
}

std::pair<EdgeId, EdgeId> Graph::minmax_edge_ids(NodeId node) const {
  check_node(node);
  return csr_.get_unchecked_minmax_edge_ids(node);
}

const std::string& Graph::node_name(NodeId node) const {
  check_node(node);
  return nodes_.translate(node);
}

NodeId Graph::node_id(const std::string& name) const {
  auto id = nodes_.get(name);
  if (!id) throw MalformedInput("unknown node name '" + name + "'");
  return *id;
}

std::span<const NodeTypeId> Graph::node_types(NodeId node) const {
  check_node(node);
  if (!node_types_) return {};
  return node_types_->types_of(node);
}

bool Graph::has_edge_with_type(NodeId src, NodeId dst, EdgeTypeId edge_type) const {
  auto first = csr_.find_edge(src, dst);
  if (!first) return false;
  const auto end = csr_.get_unchecked_minmax_edge_ids(src).second;
  for (auto e = *first; e < end && csr_.get_unchecked_destination(e) == dst; ++e) {
    if (get_unchecked_edge_type(e) == edge_type) return true;
  }
  return false;
}

bool Graph::has_edge_from_names(const std::string& src, const std::string& dst) const {
  auto s = nodes_.get(src);
  auto d = nodes_.get(dst);
  return s && d && csr_.has_edge(*s, *d);
}

Weight Graph::edge_weight(EdgeId edge) const {
  if (edge >= num_directed_edges()) throw InvalidEdgeId(edge, num_directed_edges());
  return get_unchecked_edge_weight(edge);
}

EdgeTypeId Graph::edge_type(EdgeId edge) const {
  if (edge >= num_directed_edges()) throw InvalidEdgeId(edge, num_directed_edges());
  return get_unchecked_edge_type(edge);
}

std::uint64_t Graph::encode_edge(NodeId src, NodeId dst) const {
  check_node(src);
  check_node(dst);
  return static_cast<std::uint64_t>(src) * num_nodes() + dst;
}

NodePair Graph::decode_edge(std::uint64_t code) const {
  if (code >= max_encodable_edge_number()) {
    throw MalformedInput("encoded edge " + std::to_string(code) + " exceeds the maximum " +
                         std::to_string(max_encodable_edge_number()));
  }
  return {static_cast<NodeId>(code / num_nodes()), static_cast<NodeId>(code % num_nodes())};
}

double Graph::mean_degree() const noexcept {
  if (num_nodes() == 0) return 0.0;
  return static_cast<double>(num_directed_edges()) / static_cast<double>(num_nodes());
}

double Graph::median_degree() const {
  const auto n = static_cast<std::size_t>(num_nodes());
  if (n == 0) return 0.0;
  std::vector<EdgeId> degrees(n);
  for (std::size_t u = 0; u < n; ++u) degrees[u] = csr_.get_unchecked_degree(static_cast<NodeId>(u));
  const auto mid = degrees.begin() + static_cast<std::ptrdiff_t>(n / 2);
  std::nth_element(degrees.begin(), mid, degrees.end());
  if (n % 2 == 1) return static_cast<double>(*mid);
  const auto lower = *std::max_element(degrees.begin(), mid);
  return (static_cast<double>(lower) + static_cast<double>(*mid)) / 2.0;
}

double Graph::density() const noexcept {
  const auto n = static_cast<double>(num_nodes());
  if (num_nodes() < 2) return 0.0;
  return static_cast<double>(num_directed_edges() - num_selfloops_) / (n * (n - 1.0));
}

std::uint64_t Graph::hash() const noexcept {
  std::uint64_t h = directed_ ? 1 : 0;
  hash_combine(h, csr_.hash());
  for (const auto& k : nodes_.keys()) hash_combine(h, std::hash<std::string>{}(k));
  if (weights_) {
    for (auto w : *weights_) hash_combine(h, std::bit_cast<std::uint32_t>(w));
  }
  if (node_types_) hash_combine(h, node_types_->hash());
  if (edge_types_) hash_combine(h, edge_types_->hash());
  return h;
}

Graph::Parts Graph::parts() const {
  Parts p;
  p.name = name_;
  p.directed = directed_;
  p.nodes = nodes_;
  p.node_types = node_types_;
  if (edge_types_) p.edge_type_vocabulary = edge_types_->vocabulary();
  p.weighted = weights_.has_value();
  return p;
}

std::vector<Graph::RawEdge> Graph::raw_edges(const ParallelContext& ctx) const {
  const auto n = static_cast<std::int64_t>(num_nodes());
  std::vector<RawEdge> out(static_cast<std::size_t>(num_directed_edges()));
#pragma omp parallel for schedule(dynamic, 1024) num_threads(ctx.threads())
  for (std::int64_t u = 0; u < n; ++u) {
    const auto src = static_cast<NodeId>(u);
    const auto [begin, end] = csr_.get_unchecked_minmax_edge_ids(src);
    for (auto e = begin; e < end; ++e) {
      out[static_cast<std::size_t>(e)] = {src, csr_.get_unchecked_destination(e), get_unchecked_edge_type(e),
                                          get_unchecked_edge_weight(e)};
    }
  }
  return out;
}

} // namespace ensgraph::core
