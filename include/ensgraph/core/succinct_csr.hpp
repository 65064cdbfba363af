/* Succinct adjacency: the CSR content as one Elias-Fano sequence.
 *
 * Directed edge e is stored as the code src * N + dst. Codes are
 * non-decreasing in edge id order (duplicates allowed for multigraphs), so
 * edge ids, degrees and neighbour slices all reduce to rank/select on the
 * sequence. Decoding reproduces the plain Csr arrays exactly.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "ensgraph/core/csr.hpp"
#include "ensgraph/core/elias_fano.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

class SuccinctCsr {
public:
  SuccinctCsr() = default;

  [[nodiscard]] static SuccinctCsr from_csr(const Csr& csr, const ParallelContext& ctx = {});

  [[nodiscard]] NodeId num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] EdgeId num_edges() const noexcept { return codes_.size(); }

  [[nodiscard]] EdgeId degree(NodeId src) const;
  [[nodiscard]] std::pair<EdgeId, EdgeId> minmax_edge_ids(NodeId src) const;
  [[nodiscard]] std::vector<NodeId> neighbours(NodeId src) const;
  [[nodiscard]] NodePair endpoints(EdgeId edge) const;
  [[nodiscard]] bool has_edge(NodeId src, NodeId dst) const;
  [[nodiscard]] std::optional<EdgeId> find_edge(NodeId src, NodeId dst) const;

  [[nodiscard]] Csr to_csr(const ParallelContext& ctx = {}) const;

  [[nodiscard]] std::size_t memory_bytes() const { return codes_.memory_bytes(); }

private:
  [[nodiscard]] std::uint64_t code(NodeId src, NodeId dst) const noexcept {
    return static_cast<std::uint64_t>(src) * num_nodes_ + dst;
  }
  void check_node(NodeId node) const;

  NodeId num_nodes_ {0};
  EliasFano codes_ {};
};

} // namespace ensgraph::core
