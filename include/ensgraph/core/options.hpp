/* Option structs shared by construction and the algorithms. */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Construction policies.
//
// - directed: when false every edge (u, v) with u != v is materialized as
//   both (u, v) and (v, u); self-loops are stored once.
// - skip_selfloops: drop (u, u) edges.
// - skip_duplicates: keep only the first of several edges with the same
//   (src, dst, edge type); when false the graph is a multigraph.
struct EdgeListOptions {
  bool directed {false};
  bool skip_selfloops {false};
  bool skip_duplicates {true};
  std::string name {"Graph"};
};

// Spanning tree / arborescence options.
//
// The seed selects among equally valid trees; it is not a root. Edges whose
// type is listed in `undesired_edge_types` are only considered after every
// other edge when include_all_edge_types is true, and never otherwise.
struct SpanningTreeOptions {
  std::uint64_t seed {0};
  bool include_all_edge_types {true};
  std::vector<EdgeTypeId> undesired_edge_types {};
};

struct NegativeSamplingOptions {
  std::uint64_t count {0};
  std::uint64_t seed {0};
  // Sample sources and destinations proportionally to their degree.
  bool degree_weighted {false};
  bool allow_selfloops {false};
  // Rejection attempts allowed per requested sample before giving up.
  std::uint64_t max_attempts_factor {100};
};

} // namespace ensgraph::core
