/* Immutable graph: CSR adjacency, node vocabulary and optional payloads. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ensgraph/core/csr.hpp"
#include "ensgraph/core/options.hpp"
#include "ensgraph/core/parallel.hpp"
#include "ensgraph/core/succinct_csr.hpp"
#include "ensgraph/core/type_assignments.hpp"
#include "ensgraph/core/types.hpp"
#include "ensgraph/core/vocabulary.hpp"

namespace ensgraph::core {

// Edge of an unsorted input stream, addressed by node names.
struct EdgeRecord {
  std::string src;
  std::string dst;
  std::optional<std::string> edge_type {};
  std::optional<Weight> weight {};
};

// Node of an optional node list; fixes the node order and node types.
struct NodeRecord {
  std::string name;
  std::vector<std::string> node_types {};
};

// Edge of a pre-sorted numeric stream. Undirected inputs must already list
// both directions of every edge.
struct SortedEdge {
  NodeId src;
  NodeId dst;
  EdgeTypeId edge_type {kNoType};
  std::optional<Weight> weight {};
};

// Notes on identifiers:
// - NodeId follows the node vocabulary order: node list order first, then
//   first appearance in the edge stream.
// - EdgeId is the position of a directed edge in (src, dst, edge type)
//   order. An undirected edge {u, v} with u != v owns two EdgeIds.
// - Every "mutating" operation returns a new Graph. set_directed() is the
//   only in-place change and touches metadata only.
class Graph {
public:
  Graph() = default;

  // Throws MalformedInput on inconsistent weights (some edges weighted,
  // others not, or non-finite / non-positive values) and on edges naming a
  // node absent from a provided node list.
  [[nodiscard]] static Graph from_unsorted_edges(std::span<const EdgeRecord> edges,
                                                 std::optional<std::span<const NodeRecord>> nodes,
                                                 const EdgeListOptions& options = {},
                                                 const ParallelContext& ctx = {});

  // Skips the sorting pass. Throws MalformedInput when the edges are not
  // sorted by (src, dst, edge type) or reference ids outside the vocabularies.
  [[nodiscard]] static Graph from_sorted_edges(NodeVocabulary nodes,
                                               std::span<const SortedEdge> edges,
                                               std::optional<TypeVocabulary> edge_types,
                                               const EdgeListOptions& options = {},
                                               const ParallelContext& ctx = {});

  // Nodes 0..num_nodes-1 named by their decimal id.
  [[nodiscard]] static Graph from_integer_edges(NodeId num_nodes,
                                                std::span<const NodePair> edges,
                                                const EdgeListOptions& options = {},
                                                const ParallelContext& ctx = {});

  // Metadata
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] bool is_directed() const noexcept { return directed_; }
  [[nodiscard]] bool has_edge_weights() const noexcept { return weights_.has_value(); }
  [[nodiscard]] bool has_node_types() const noexcept { return node_types_.has_value(); }
  [[nodiscard]] bool has_edge_types() const noexcept { return edge_types_.has_value(); }

  // Counts
  [[nodiscard]] NodeId num_nodes() const noexcept { return csr_.num_nodes(); }
  [[nodiscard]] EdgeId num_directed_edges() const noexcept { return csr_.num_edges(); }
  // Undirected graphs count {u, v} once.
  [[nodiscard]] EdgeId num_edges() const noexcept;
  [[nodiscard]] EdgeId num_selfloops() const noexcept { return num_selfloops_; }
  [[nodiscard]] NodeId num_singletons() const noexcept { return num_singletons_; }
  [[nodiscard]] NodeId num_traps() const noexcept { return num_traps_; }
  [[nodiscard]] bool has_trap_nodes() const noexcept { return num_traps_ > 0; }

  // Storage
  [[nodiscard]] const Csr& adjacency() const noexcept { return csr_; }
  [[nodiscard]] const NodeVocabulary& node_vocabulary() const noexcept { return nodes_; }
  [[nodiscard]] const std::optional<TypeAssignments>& node_type_assignments() const noexcept {
    return node_types_;
  }
  [[nodiscard]] const std::optional<TypeAssignments>& edge_type_assignments() const noexcept {
    return edge_types_;
  }
  [[nodiscard]] std::optional<std::span<const Weight>> weights_view() const noexcept;
  [[nodiscard]] SuccinctCsr to_succinct_adjacency(const ParallelContext& ctx = {}) const;

  // Node queries. All throw InvalidNodeId on out-of-range ids.
  [[nodiscard]] EdgeId degree(NodeId node) const { return csr_.degree(node); }
  [[nodiscard]] std::span<const NodeId> neighbours(NodeId node) const { return csr_.neighbours(node); }
  [[nodiscard]] std::pair<EdgeId, EdgeId> minmax_edge_ids(NodeId node) const;
  [[nodiscard]] bool is_trap(NodeId node) const { return csr_.degree(node) == 0; }
  [[nodiscard]] const std::string& node_name(NodeId node) const;
  // Throws MalformedInput for an unknown name.
  [[nodiscard]] NodeId node_id(const std::string& name) const;
  // Empty when the node is untyped or the graph has no node types.
  [[nodiscard]] std::span<const NodeTypeId> node_types(NodeId node) const;

  // Edge queries. Edge ids out of range throw InvalidEdgeId.
  [[nodiscard]] bool has_edge(NodeId src, NodeId dst) const { return csr_.has_edge(src, dst); }
  [[nodiscard]] bool has_edge_with_type(NodeId src, NodeId dst, EdgeTypeId edge_type) const;
  [[nodiscard]] bool has_edge_from_names(const std::string& src, const std::string& dst) const;
  [[nodiscard]] std::optional<EdgeId> edge_id(NodeId src, NodeId dst) const { return csr_.find_edge(src, dst); }
  [[nodiscard]] NodePair edge_node_ids(EdgeId edge) const { return csr_.endpoints(edge); }
  // 1.0 when the graph is unweighted.
  [[nodiscard]] Weight edge_weight(EdgeId edge) const;
  // kNoType when the edge is untyped or the graph has no edge types.
  [[nodiscard]] EdgeTypeId edge_type(EdgeId edge) const;

  // Unchecked hot-path accessors for the algorithms.
  [[nodiscard]] Weight get_unchecked_edge_weight(EdgeId edge) const noexcept {
    return weights_ ? (*weights_)[static_cast<std::size_t>(edge)] : 1.0F;
  }
  [[nodiscard]] EdgeTypeId get_unchecked_edge_type(EdgeId edge) const noexcept {
    return edge_types_ ? edge_types_->single_type_of(static_cast<std::size_t>(edge)) : kNoType;
  }

  // Edge encoding: code = src * N + dst.
  [[nodiscard]] std::uint64_t encode_edge(NodeId src, NodeId dst) const;
  // Throws MalformedInput when code >= max_encodable_edge_number().
  [[nodiscard]] NodePair decode_edge(std::uint64_t code) const;
  // N * N; NodeId is 32 bits wide, so the product always fits 64 bits.
  [[nodiscard]] std::uint64_t max_encodable_edge_number() const noexcept {
    return static_cast<std::uint64_t>(num_nodes()) * num_nodes();
  }

  // Degree statistics (out-degree); zero on an empty graph.
  [[nodiscard]] EdgeId min_degree() const noexcept { return min_degree_; }
  [[nodiscard]] EdgeId max_degree() const noexcept { return max_degree_; }
  [[nodiscard]] double mean_degree() const noexcept;
  [[nodiscard]] double median_degree() const;
  // Directed edges over N * (N - 1), self-loops excluded.
  [[nodiscard]] double density() const noexcept;

  // Structural hash over adjacency, node names, weights and types.
  [[nodiscard]] std::uint64_t hash() const noexcept;
  [[nodiscard]] std::string textual_report() const;

  // Derived graphs
  [[nodiscard]] Graph drop_selfloops(const ParallelContext& ctx = {}) const;
  // Adds (u, u) to every node lacking one. A weighted graph requires
  // `weight`; `edge_type` names a type added to the edge type vocabulary.
  [[nodiscard]] Graph add_selfloops(std::optional<std::string> edge_type = std::nullopt,
                                    std::optional<Weight> weight = std::nullopt,
                                    const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph set_all_edge_types(const std::string& edge_type, const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph set_all_node_types(const std::string& node_type) const;
  [[nodiscard]] Graph remove_edge_weights() const;
  [[nodiscard]] Graph remove_edge_types(const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph remove_node_types() const;
  // Keeps every directed edge and flags the result directed.
  [[nodiscard]] Graph to_directed() const;
  // Node order of `other`. Throws MalformedInput unless both graphs have the
  // same node names.
  [[nodiscard]] Graph remap(const Graph& other, const ParallelContext& ctx = {}) const;
  // Node i of the result is node node_ids[i] of this graph; node_ids must be
  // a permutation of [0, N).
  [[nodiscard]] Graph remap_from_node_ids(std::span<const NodeId> node_ids,
                                          const ParallelContext& ctx = {}) const;

  // In-place metadata toggle; the arrays are left untouched.
  void set_directed(bool directed) noexcept { directed_ = directed; }
  void set_name(std::string name) { name_ = std::move(name); }

  // Set algebra. Edge identity is (src name, dst name, edge type name).
  // Throws IncompatibleGraphs unless is_compatible(other), which requires
  // equal directedness and the same presence of weights and edge types.
  // The result holds the nodes of both graphs, this graph's first; node
  // types of shared nodes are merged. Union keeps this graph's weight for
  // edges present in both.
  [[nodiscard]] bool is_compatible(const Graph& other) const noexcept;
  [[nodiscard]] Graph union_with(const Graph& other, const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph intersection(const Graph& other, const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph difference(const Graph& other, const ParallelContext& ctx = {}) const;
  [[nodiscard]] Graph symmetric_difference(const Graph& other, const ParallelContext& ctx = {}) const;
  [[nodiscard]] bool overlaps(const Graph& other) const;
  [[nodiscard]] bool contains(const Graph& other) const;

  friend bool operator==(const Graph& a, const Graph& b) {
    return a.directed_ == b.directed_ && a.nodes_ == b.nodes_ && a.csr_ == b.csr_ &&
           a.weights_ == b.weights_ && a.node_types_ == b.node_types_ && a.edge_types_ == b.edge_types_;
  }

private:
  // Directed edge with dense ids, the unit every constructor reduces to.
  struct RawEdge {
    NodeId src;
    NodeId dst;
    EdgeTypeId edge_type;
    Weight weight;
  };

  struct Parts {
    std::string name;
    bool directed {false};
    NodeVocabulary nodes {};
    std::optional<TypeAssignments> node_types {};
    std::optional<TypeVocabulary> edge_type_vocabulary {};
    bool weighted {false};
  };

  // Sorts (unless already sorted), applies the self-loop and duplicate
  // policies and writes the result through the concurrent builder. When
  // `add_reverse` is set every non-loop edge is mirrored first.
  [[nodiscard]] static Graph build(Parts parts, std::vector<RawEdge> edges, bool add_reverse,
                                   bool skip_selfloops, bool skip_duplicates, const ParallelContext& ctx);
  // Same, for edges already sorted and filtered.
  [[nodiscard]] static Graph assemble(Parts parts, std::span<const RawEdge> edges, const ParallelContext& ctx);

  enum class SetOperation { Union, Intersection, Difference, SymmetricDifference };

  [[nodiscard]] Graph combine(const Graph& other, SetOperation op, const ParallelContext& ctx) const;
  [[nodiscard]] Parts parts() const;
  [[nodiscard]] std::vector<RawEdge> raw_edges(const ParallelContext& ctx = {}) const;
  void compute_statistics(const ParallelContext& ctx);
  void check_node(NodeId node) const;
  void check_compatible(const Graph& other) const;

  std::string name_ {"Graph"};
  bool directed_ {false};
  NodeVocabulary nodes_ {};
  Csr csr_ {};
  std::optional<std::vector<Weight>> weights_ {};
  std::optional<TypeAssignments> node_types_ {};
  // Flat assignment, one slot per directed edge.
  std::optional<TypeAssignments> edge_types_ {};

  EdgeId num_selfloops_ {0};
  NodeId num_singletons_ {0};
  NodeId num_traps_ {0};
  EdgeId min_degree_ {0};
  EdgeId max_degree_ {0};
};

} // namespace ensgraph::core
