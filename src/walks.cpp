/*
  Random walks: first-order and second-order (node2vec-style) sampling.

  Per step the candidate edges of the current node (optionally a seeded
  window of max_neighbours of them) are scored from the edge weight and the
  four walk weights, then one edge is drawn proportionally. Unweighted
  first-order walks skip the scoring and draw uniformly.
*/
#include "ensgraph/core/walks.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

namespace {
constexpr std::uint64_t kStartRedraws = 64;

bool active(double w) noexcept {
  return std::abs(w - 1.0) > 1e-12;
}
} // namespace

RandomWalker::RandomWalker(const Graph& graph, WalksParameters parameters)
    : graph_(&graph), parameters_(std::move(parameters)) {
  uniform_ = !graph.has_edge_weights() && parameters_.is_first_order_walk();
  const auto& csr = graph.adjacency();
  sources_.reserve(static_cast<std::size_t>(graph.num_nodes()));
  for (NodeId u = 0; u < graph.num_nodes(); ++u) {
    if (!parameters_.no_traps() || csr.get_unchecked_degree(u) > 0) sources_.push_back(u);
  }
  ENSGRAPH_DEBUG("walker on '", graph.name(), "': ", uniform_ ? "uniform first-order" : "weighted", " walks of length ",
                 parameters_.walk_length(), ", ", sources_.size(), " start nodes");
}

WalkSequence RandomWalker::random_walks(std::uint64_t quantity) const {
  if (quantity > 0 && graph_->num_nodes() == 0) {
    throw MalformedInput("cannot sample random walks on graph '" + graph_->name() + "' without nodes");
  }
  ENSGRAPH_INFO("random walks on '", graph_->name(), "': ", quantity, " x ", parameters_.iterations(), " walks");
  return WalkSequence(*this, quantity, false);
}

WalkSequence RandomWalker::complete_walks() const {
  ENSGRAPH_INFO("complete walks on '", graph_->name(), "': ", sources_.size(), " x ", parameters_.iterations(),
                " walks");
  return WalkSequence(*this, sources_.size(), true);
}

NodeId RandomWalker::draw_start(std::uint64_t seed) const {
  const auto n = static_cast<std::uint64_t>(graph_->num_nodes());
  auto candidate = static_cast<NodeId>(splitmix64(seed) % n);
  if (!parameters_.no_traps() || sources_.empty()) return candidate;
  const auto& csr = graph_->adjacency();
  for (std::uint64_t attempt = 1; attempt <= kStartRedraws; ++attempt) {
    if (csr.get_unchecked_degree(candidate) > 0) return candidate;
    candidate = static_cast<NodeId>(splitmix64(seed + attempt) % n);
  }
  // Mostly-trap graph: pick among the known sources directly.
  return sources_[static_cast<std::size_t>(splitmix64(seed + kStartRedraws + 1) % sources_.size())];
}

EdgeId RandomWalker::step(NodeId node, NodeId previous, std::optional<EdgeId> arrived, Xorshift& rng,
                          std::vector<double>& scratch) const {
  const auto& g = *graph_;
  const auto& csr = g.adjacency();
  auto [begin, end] = csr.get_unchecked_minmax_edge_ids(node);
  const auto max_neighbours = parameters_.single_walk_parameters().max_neighbours();
  if (max_neighbours && end - begin > *max_neighbours) {
    begin += rng.below(end - begin - *max_neighbours + 1);
    end = begin + *max_neighbours;
  }
  if (uniform_) return begin + rng.below(end - begin);

  const auto& w = parameters_.single_walk_parameters().weights();
  const auto& node_types = g.node_type_assignments();
  const bool node_type_bias = node_types && active(w.change_node_type_weight());
  const bool edge_type_bias = arrived && g.has_edge_types() && active(w.change_edge_type_weight());
  const bool return_bias = arrived && active(w.return_weight());
  const bool explore_bias = arrived && active(w.explore_weight());
  const auto current_types = node_type_bias ? node_types->types_of(node) : std::span<const NodeTypeId> {};
  const auto arrived_type = arrived ? g.get_unchecked_edge_type(*arrived) : kNoType;
  const auto previous_end = explore_bias ? csr.get_unchecked_minmax_edge_ids(previous).second : EdgeId {0};

  scratch.resize(static_cast<std::size_t>(end - begin));
  for (auto e = begin; e < end; ++e) {
    const auto dst = csr.get_unchecked_destination(e);
    double p = g.get_unchecked_edge_weight(e);
    if (node_type_bias && std::ranges::equal(node_types->types_of(dst), current_types)) {
      p /= w.change_node_type_weight();
    }
    if (edge_type_bias && g.get_unchecked_edge_type(e) == arrived_type) p /= w.change_edge_type_weight();
    if (dst == previous || dst == node) {
      if (return_bias) p *= w.return_weight();
    } else if (explore_bias) {
      const auto pos = csr.get_unchecked_edge_id_lower_bound(previous, dst);
      const bool adjacent_to_previous = pos < previous_end && csr.get_unchecked_destination(pos) == dst;
      if (!adjacent_to_previous) p *= w.explore_weight();
    }
    scratch[static_cast<std::size_t>(e - begin)] = p;
  }
  return begin + sample_weighted(std::span<const double>(scratch), rng);
}

std::vector<NodeId> RandomWalker::walk_from(NodeId start, std::uint64_t seed) const {
  const auto& csr = graph_->adjacency();
  if (start >= graph_->num_nodes()) throw InvalidNodeId(start, graph_->num_nodes());
  const auto length = parameters_.walk_length();
  std::vector<NodeId> walk;
  walk.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(length, 1U << 16)));
  walk.push_back(start);
  Xorshift rng(seed);
  std::vector<double> scratch;
  NodeId current = start;
  NodeId previous = kNodeNotPresent;
  std::optional<EdgeId> arrived;
  while (walk.size() < length && csr.get_unchecked_degree(current) > 0) {
    const auto e = step(current, previous, arrived, rng, scratch);
    previous = current;
    current = csr.get_unchecked_destination(e);
    arrived = e;
    walk.push_back(current);
  }
  return walk;
}

std::vector<NodeId> WalkSequence::walk_at(std::uint64_t i) const {
  const auto local = i % quantity_;
  const auto seed = walker_.parameters().random_state();
  // Iterations share their start node and differ in the walk seed.
  const auto start = complete_ ? walker_.sources_[static_cast<std::size_t>(local)]
                               : walker_.draw_start(splitmix64(seed + local));
  return walker_.walk_from(start, splitmix64(seed ^ splitmix64(i)));
}

std::vector<NodeId> WalkSequence::at(std::uint64_t i) const {
  if (i >= size()) {
    throw std::out_of_range("walk index " + std::to_string(i) + " is out of range, sequence has " +
                            std::to_string(size()) + " walks");
  }
  return walk_at(i);
}

WalkSequence::iterator::reference WalkSequence::iterator::operator*() const {
  if (!cached_) {
    walk_ = sequence_->at(index_);
    cached_ = true;
  }
  return walk_;
}

std::vector<std::vector<NodeId>> WalkSequence::collect(const ParallelContext& ctx) const {
  const auto n = static_cast<std::int64_t>(size());
  std::vector<std::vector<NodeId>> out(static_cast<std::size_t>(n));
#pragma omp parallel for schedule(dynamic, 64) num_threads(ctx.threads())
  for (std::int64_t i = 0; i < n; ++i) {
    out[static_cast<std::size_t>(i)] = walk_at(static_cast<std::uint64_t>(i));
  }
  return out;
}

} // namespace ensgraph::core
