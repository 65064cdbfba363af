#include "ensgraph/core/succinct_csr.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"

namespace ensgraph::core {

SuccinctCsr SuccinctCsr::from_csr(const Csr& csr, const ParallelContext& ctx) {
  SuccinctCsr out;
  out.num_nodes_ = csr.num_nodes();
  const auto n = static_cast<std::int64_t>(csr.num_nodes());
  const auto offsets = csr.offsets_view();
  const auto destinations = csr.destinations_view();
  std::vector<std::uint64_t> codes(static_cast<std::size_t>(csr.num_edges()));
#pragma omp parallel for schedule(dynamic, 1024) num_threads(ctx.threads())
  for (std::int64_t u = 0; u < n; ++u) {
    const auto src = static_cast<NodeId>(u);
    for (auto e = offsets[u]; e < offsets[u + 1]; ++e) {
      codes[static_cast<std::size_t>(e)] = out.code(src, destinations[static_cast<std::size_t>(e)]);
    }
  }
  const auto universe = static_cast<std::uint64_t>(out.num_nodes_) * out.num_nodes_;
  out.codes_ = EliasFano::from_sorted(codes, universe);
  ENSGRAPH_DEBUG("succinct adjacency: ", codes.size(), " edges in ", out.codes_.memory_bytes(),
                 " bytes, ", out.codes_.low_bits(), " low bits");
  return out;
}

void SuccinctCsr::check_node(NodeId node) const {
  if (node >= num_nodes_) throw InvalidNodeId(node, num_nodes_);
}

std::pair<EdgeId, EdgeId> SuccinctCsr::minmax_edge_ids(NodeId src) const {
  check_node(src);
  const auto begin = codes_.rank(code(src, 0));
  const auto end = src + 1 == num_nodes_ ? codes_.size() : codes_.rank(code(src + 1, 0));
  return {begin, end};
}

EdgeId SuccinctCsr::degree(NodeId src) const {
  const auto [begin, end] = minmax_edge_ids(src);
  return end - begin;
}

std::vector<NodeId> SuccinctCsr::neighbours(NodeId src) const {
  const auto [begin, end] = minmax_edge_ids(src);
  std::vector<std::uint64_t> codes;
  codes_.decode_range(begin, end, codes);
  std::vector<NodeId> out;
  out.reserve(codes.size());
  const auto base = code(src, 0);
  for (auto c : codes) out.push_back(static_cast<NodeId>(c - base));
  return out;
}

NodePair SuccinctCsr::endpoints(EdgeId edge) const {
  if (edge >= codes_.size()) throw InvalidEdgeId(edge, codes_.size());
  const auto c = codes_.get_unchecked(edge);
  return {static_cast<NodeId>(c / num_nodes_), static_cast<NodeId>(c % num_nodes_)};
}

bool SuccinctCsr::has_edge(NodeId src, NodeId dst) const {
  return find_edge(src, dst).has_value();
}

std::optional<EdgeId> SuccinctCsr::find_edge(NodeId src, NodeId dst) const {
  check_node(src);
  check_node(dst);
  return codes_.index_of(code(src, dst));
}

Csr SuccinctCsr::to_csr(const ParallelContext& ctx) const {
  const auto n = static_cast<std::int64_t>(num_nodes_);
  std::vector<EdgeId> offsets(static_cast<std::size_t>(num_nodes_) + 1, 0);
#pragma omp parallel for schedule(static) num_threads(ctx.threads())
  for (std::int64_t u = 0; u < n; ++u) {
    offsets[static_cast<std::size_t>(u)] = codes_.rank(code(static_cast<NodeId>(u), 0));
  }
  offsets[static_cast<std::size_t>(num_nodes_)] = codes_.size();
  const auto codes = codes_.decode();
  std::vector<NodeId> destinations(codes.size());
  for (std::size_t i = 0; i < codes.size(); ++i) {
    destinations[i] = static_cast<NodeId>(codes[i] % num_nodes_);
  }
  return Csr(std::move(offsets), std::move(destinations));
}

} // namespace ensgraph::core
