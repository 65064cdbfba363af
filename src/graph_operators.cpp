/*
  Graph set algebra over directed edges identified by
  (src name, dst name, edge type name).

  For every edge of an operand the membership in the other operand is
  resolved in parallel through the other graph's vocabularies; surviving
  edges are translated into the merged vocabularies and rebuilt.
*/
#include "ensgraph/core/graph.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

namespace {

// Maps every id of `from` to the id of the same key in `to`, or `missing`.
template <typename K, typename Id>
std::vector<Id> translate_ids(const Vocabulary<K, Id>& from, const Vocabulary<K, Id>& to, Id missing) {
  std::vector<Id> out;
  out.reserve(from.size());
  for (const auto& key : from.keys()) out.push_back(to.get(key).value_or(missing));
  return out;
}

} // namespace

bool Graph::is_compatible(const Graph& other) const noexcept {
  return directed_ == other.directed_ && has_edge_weights() == other.has_edge_weights() &&
         has_edge_types() == other.has_edge_types();
}

void Graph::check_compatible(const Graph& other) const {
  if (directed_ != other.directed_) {
    throw IncompatibleGraphs("graphs '" + name_ + "' and '" + other.name_ + "' must both be directed or undirected");
  }
  if (has_edge_weights() != other.has_edge_weights()) {
    throw IncompatibleGraphs("graphs '" + name_ + "' and '" + other.name_ + "' must both have weights or neither");
  }
  if (has_edge_types() != other.has_edge_types()) {
    throw IncompatibleGraphs("graphs '" + name_ + "' and '" + other.name_ +
                             "' must both have edge types or neither");
  }
}

Graph Graph::combine(const Graph& other, SetOperation op, const ParallelContext& ctx) const {
  check_compatible(other);

  const char* symbol = "|";
  switch (op) {
    case SetOperation::Union: symbol = "|"; break;
    case SetOperation::Intersection: symbol = "&"; break;
    case SetOperation::Difference: symbol = "-"; break;
    case SetOperation::SymmetricDifference: symbol = "^"; break;
  }
  Parts p = parts();
  p.name = "(" + name_ + " " + symbol + " " + other.name_ + ")";

  // Merged node vocabulary: ours, then the new nodes of `other`.
  for (const auto& key : other.nodes_.keys()) p.nodes.insert(key);
  const auto other_to_merged_node = translate_ids(other.nodes_, p.nodes, kNodeNotPresent);
  const auto ours_in_other = translate_ids(nodes_, other.nodes_, kNodeNotPresent);
  const auto theirs_in_ours = translate_ids(other.nodes_, nodes_, kNodeNotPresent);

  std::vector<EdgeTypeId> other_to_merged_type;
  std::vector<EdgeTypeId> our_types_in_other;
  std::vector<EdgeTypeId> their_types_in_ours;
  if (edge_types_) {
    const auto& theirs = other.edge_types_->vocabulary();
    for (const auto& key : theirs.keys()) p.edge_type_vocabulary->insert(key);
    other_to_merged_type = translate_ids(theirs, *p.edge_type_vocabulary, kNoType);
    our_types_in_other = translate_ids(edge_types_->vocabulary(), theirs, kNoType);
    their_types_in_ours = translate_ids(theirs, edge_types_->vocabulary(), kNoType);
  }

  if (node_types_ || other.node_types_) {
    TypeVocabulary merged = node_types_ ? node_types_->vocabulary() : TypeVocabulary {};
    std::vector<NodeTypeId> other_to_merged_node_type;
    if (other.node_types_) {
      for (const auto& key : other.node_types_->vocabulary().keys()) merged.insert(key);
      other_to_merged_node_type = translate_ids(other.node_types_->vocabulary(), merged, kNoType);
    }
    std::vector<std::vector<NodeTypeId>> lists(p.nodes.size());
    if (node_types_) {
      for (NodeId u = 0; u < num_nodes(); ++u) {
        auto ts = node_types_->types_of(u);
        lists[u].assign(ts.begin(), ts.end());
      }
    }
    if (other.node_types_) {
      for (NodeId u = 0; u < other.num_nodes(); ++u) {
        auto& target = lists[other_to_merged_node[u]];
        for (auto t : other.node_types_->types_of(u)) {
          const auto merged_type = other_to_merged_node_type[t];
          if (std::find(target.begin(), target.end(), merged_type) == target.end()) target.push_back(merged_type);
        }
      }
    }
    p.node_types = TypeAssignments::from_lists(std::move(merged), lists);
  }

  // Membership of each directed edge of `a` in `b`, ids translated through
  // the given tables.
  auto membership = [&ctx](const Graph& a, const Graph& b, const std::vector<NodeId>& node_map,
                           const std::vector<EdgeTypeId>& type_map) {
    const auto n = static_cast<std::int64_t>(a.num_nodes());
    std::vector<std::uint8_t> present(static_cast<std::size_t>(a.num_directed_edges()), 0);
#pragma omp parallel for schedule(dynamic, 1024) num_threads(ctx.threads())
    for (std::int64_t u = 0; u < n; ++u) {
      const auto src = static_cast<NodeId>(u);
      const auto bs = node_map[src];
      if (bs == kNodeNotPresent) continue;
      const auto [begin, end] = a.csr_.get_unchecked_minmax_edge_ids(src);
      for (auto e = begin; e < end; ++e) {
        const auto bd = node_map[a.csr_.get_unchecked_destination(e)];
        if (bd == kNodeNotPresent) continue;
        const auto t = a.get_unchecked_edge_type(e);
        const auto bt = t == kNoType ? kNoType : type_map[t];
        if (t != kNoType && bt == kNoType) continue;
        present[static_cast<std::size_t>(e)] = b.has_edge_with_type(bs, bd, bt) ? 1 : 0;
      }
    }
    return present;
  };

  const bool keep_ours_if_shared = op == SetOperation::Union || op == SetOperation::Intersection;
  const bool keep_ours_if_unique = op != SetOperation::Intersection;
  const bool add_theirs = op == SetOperation::Union || op == SetOperation::SymmetricDifference;

  std::vector<RawEdge> edges;
  const auto ours = raw_edges(ctx);
  const auto ours_shared = membership(*this, other, ours_in_other, our_types_in_other);
  for (std::size_t i = 0; i < ours.size(); ++i) {
    if (ours_shared[i] ? keep_ours_if_shared : keep_ours_if_unique) edges.push_back(ours[i]);
  }
  if (add_theirs) {
    const auto theirs = other.raw_edges(ctx);
    const auto theirs_shared = membership(other, *this, theirs_in_ours, their_types_in_ours);
    for (std::size_t i = 0; i < theirs.size(); ++i) {
      if (theirs_shared[i]) continue;
      auto e = theirs[i];
      e.src = other_to_merged_node[e.src];
      e.dst = other_to_merged_node[e.dst];
      if (e.edge_type != kNoType) e.edge_type = other_to_merged_type[e.edge_type];
      edges.push_back(e);
    }
  }
  ENSGRAPH_DEBUG("graph ", p.name, ": ", edges.size(), " directed edges over ", p.nodes.size(), " nodes");
  return build(std::move(p), std::move(edges), false, false, false, ctx);
}

Graph Graph::union_with(const Graph& other, const ParallelContext& ctx) const {
  return combine(other, SetOperation::Union, ctx);
}

Graph Graph::intersection(const Graph& other, const ParallelContext& ctx) const {
  return combine(other, SetOperation::Intersection, ctx);
}

Graph Graph::difference(const Graph& other, const ParallelContext& ctx) const {
  return combine(other, SetOperation::Difference, ctx);
}

Graph Graph::symmetric_difference(const Graph& other, const ParallelContext& ctx) const {
  return combine(other, SetOperation::SymmetricDifference, ctx);
}

bool Graph::overlaps(const Graph& other) const {
  for (NodeId u = 0; u < num_nodes(); ++u) {
    auto os = other.nodes_.get(nodes_.translate(u));
    if (!os) continue;
    for (auto v : csr_.get_unchecked_neighbours(u)) {
      auto od = other.nodes_.get(nodes_.translate(v));
      if (od && other.csr_.has_edge(*os, *od)) return true;
    }
  }
  return false;
}

bool Graph::contains(const Graph& other) const {
  for (NodeId u = 0; u < other.num_nodes(); ++u) {
    auto s = nodes_.get(other.nodes_.translate(u));
    if (!s) {
      if (other.csr_.get_unchecked_degree(u) > 0) return false;
      continue;
    }
    for (auto v : other.csr_.get_unchecked_neighbours(u)) {
      auto d = nodes_.get(other.nodes_.translate(v));
      if (!d || !csr_.has_edge(*s, *d)) return false;
    }
  }
  return true;
}

} // namespace ensgraph::core
