/* Error taxonomy. Every fallible operation throws one of these. */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ensgraph::core {

// Node id outside [0, num_nodes).
struct InvalidNodeId : public std::out_of_range {
  InvalidNodeId(std::uint64_t node_id, std::uint64_t num_nodes)
      : std::out_of_range("node id " + std::to_string(node_id) +
                          " is out of range, graph has " + std::to_string(num_nodes) + " nodes"),
        node_id(node_id), num_nodes(num_nodes) {}
  std::uint64_t node_id;
  std::uint64_t num_nodes;
};

// Edge id outside [0, num_directed_edges).
struct InvalidEdgeId : public std::out_of_range {
  InvalidEdgeId(std::uint64_t edge_id, std::uint64_t num_edges)
      : std::out_of_range("edge id " + std::to_string(edge_id) +
                          " is out of range, graph has " + std::to_string(num_edges) + " directed edges"),
        edge_id(edge_id), num_edges(num_edges) {}
  std::uint64_t edge_id;
  std::uint64_t num_edges;
};

struct MalformedInput : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct IncompatibleGraphs : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct UnsupportedOnDirected : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct OutOfCapacity : public std::out_of_range {
  using std::out_of_range::out_of_range;
};

struct IncompleteBuild : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace ensgraph::core
