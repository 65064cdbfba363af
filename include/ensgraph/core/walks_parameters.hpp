/* Random walk configuration. Every setter validates its own range and throws
 * MalformedInput, so an invalid configuration never reaches a walk. */
#pragma once

#include <cstdint>
#include <optional>

#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Transition biases, all strictly positive and finite; 1.0 means neutral.
// - return: multiplies moves back to the previous node (or staying put)
// - explore: multiplies moves to nodes not adjacent to the previous node
// - change node type: divides moves to a node of the current node's type
// - change edge type: divides moves along an edge of the arriving edge's type
class WalkWeights {
public:
  WalkWeights() = default;
  explicit WalkWeights(double return_weight, double explore_weight = 1.0,
                       double change_node_type_weight = 1.0, double change_edge_type_weight = 1.0);

  [[nodiscard]] double return_weight() const noexcept { return return_weight_; }
  [[nodiscard]] double explore_weight() const noexcept { return explore_weight_; }
  [[nodiscard]] double change_node_type_weight() const noexcept { return change_node_type_weight_; }
  [[nodiscard]] double change_edge_type_weight() const noexcept { return change_edge_type_weight_; }

  void set_return_weight(double w);
  void set_explore_weight(double w);
  void set_change_node_type_weight(double w);
  void set_change_edge_type_weight(double w);

  // All four weights neutral: the next step only depends on the current node.
  [[nodiscard]] bool is_first_order_walk() const noexcept;
  // Return or explore weight active.
  [[nodiscard]] bool is_node2vec_walk() const noexcept;

  // Returns w, or throws MalformedInput naming the weight.
  static double validate(const char* name, double w);

  friend bool operator==(const WalkWeights&, const WalkWeights&) = default;

private:
  double return_weight_ {1.0};
  double explore_weight_ {1.0};
  double change_node_type_weight_ {1.0};
  double change_edge_type_weight_ {1.0};
};

class SingleWalkParameters {
public:
  // walk_length counts nodes, the start included. Throws on zero.
  explicit SingleWalkParameters(std::uint64_t walk_length);

  [[nodiscard]] std::uint64_t walk_length() const noexcept { return walk_length_; }
  [[nodiscard]] const WalkWeights& weights() const noexcept { return weights_; }
  WalkWeights& weights() noexcept { return weights_; }
  // Nodes with a larger degree sample from a seeded window of this many
  // consecutive neighbours.
  [[nodiscard]] std::optional<NodeId> max_neighbours() const noexcept { return max_neighbours_; }
  void set_max_neighbours(std::optional<NodeId> max_neighbours);

  [[nodiscard]] bool is_first_order_walk() const noexcept { return weights_.is_first_order_walk(); }
  [[nodiscard]] bool is_node2vec_walk() const noexcept { return weights_.is_node2vec_walk(); }

private:
  std::uint64_t walk_length_;
  WalkWeights weights_ {};
  std::optional<NodeId> max_neighbours_ {100};
};

// Builder for a batch of walks; defaults: length 32, one iteration,
// random state splitmix64(42), at most 100 neighbours per step, traps
// allowed.
class WalksParameters {
public:
  explicit WalksParameters(std::uint64_t walk_length = 32);

  WalksParameters& set_iterations(std::uint64_t iterations);
  WalksParameters& set_max_neighbours(std::optional<NodeId> max_neighbours);
  WalksParameters& set_random_state(std::uint64_t random_state);
  WalksParameters& set_return_weight(double w);
  WalksParameters& set_explore_weight(double w);
  WalksParameters& set_change_node_type_weight(double w);
  WalksParameters& set_change_edge_type_weight(double w);
  // Walks never start from a trap node; another start is drawn instead.
  WalksParameters& set_no_traps(bool no_traps) noexcept;

  [[nodiscard]] std::uint64_t iterations() const noexcept { return iterations_; }
  [[nodiscard]] std::uint64_t random_state() const noexcept { return random_state_; }
  [[nodiscard]] bool no_traps() const noexcept { return no_traps_; }
  [[nodiscard]] std::uint64_t walk_length() const noexcept { return single_.walk_length(); }
  [[nodiscard]] const SingleWalkParameters& single_walk_parameters() const noexcept { return single_; }
  [[nodiscard]] bool is_first_order_walk() const noexcept { return single_.is_first_order_walk(); }
  [[nodiscard]] bool is_node2vec_walk() const noexcept { return single_.is_node2vec_walk(); }

private:
  SingleWalkParameters single_;
  std::uint64_t iterations_ {1};
  std::uint64_t random_state_;
  bool no_traps_ {false};
};

} // namespace ensgraph::core
