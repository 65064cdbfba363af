#include "ensgraph/core/walks_parameters.hpp"

#include <cmath>
#include <string>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/random.hpp"

namespace ensgraph::core {

namespace {
constexpr double kNeutralTolerance = 1e-12;

bool not_one(double w) noexcept {
  return std::abs(w - 1.0) > kNeutralTolerance;
}
} // namespace

double WalkWeights::validate(const char* name, double w) {
  if (!std::isfinite(w) || w <= 0.0) {
    throw MalformedInput(std::string("walk weight '") + name + "' (" + std::to_string(w) +
                         ") must be a strictly positive finite number");
  }
  return w;
}

WalkWeights::WalkWeights(double return_weight, double explore_weight, double change_node_type_weight,
                         double change_edge_type_weight)
    : return_weight_(validate("return_weight", return_weight)),
      explore_weight_(validate("explore_weight", explore_weight)),
      change_node_type_weight_(validate("change_node_type_weight", change_node_type_weight)),
      change_edge_type_weight_(validate("change_edge_type_weight", change_edge_type_weight)) {}

void WalkWeights::set_return_weight(double w) { return_weight_ = validate("return_weight", w); }
void WalkWeights::set_explore_weight(double w) { explore_weight_ = validate("explore_weight", w); }
void WalkWeights::set_change_node_type_weight(double w) {
  change_node_type_weight_ = validate("change_node_type_weight", w);
}
void WalkWeights::set_change_edge_type_weight(double w) {
  change_edge_type_weight_ = validate("change_edge_type_weight", w);
}

bool WalkWeights::is_first_order_walk() const noexcept {
  return !not_one(return_weight_) && !not_one(explore_weight_) && !not_one(change_node_type_weight_) &&
         !not_one(change_edge_type_weight_);
}

bool WalkWeights::is_node2vec_walk() const noexcept {
  return not_one(return_weight_) || not_one(explore_weight_);
}

SingleWalkParameters::SingleWalkParameters(std::uint64_t walk_length) : walk_length_(walk_length) {
  if (walk_length == 0) throw MalformedInput("walk length must be strictly positive");
}

void SingleWalkParameters::set_max_neighbours(std::optional<NodeId> max_neighbours) {
  if (max_neighbours && *max_neighbours == 0) {
    throw MalformedInput("max_neighbours must be strictly positive");
  }
  max_neighbours_ = max_neighbours;
}

WalksParameters::WalksParameters(std::uint64_t walk_length)
    : single_(walk_length), random_state_(splitmix64(42)) {}

WalksParameters& WalksParameters::set_iterations(std::uint64_t iterations) {
  if (iterations == 0) throw MalformedInput("iterations must be strictly positive");
  iterations_ = iterations;
  return *this;
}

WalksParameters& WalksParameters::set_max_neighbours(std::optional<NodeId> max_neighbours) {
  single_.set_max_neighbours(max_neighbours);
  return *this;
}

WalksParameters& WalksParameters::set_random_state(std::uint64_t random_state) {
  random_state_ = splitmix64(random_state);
  return *this;
}

WalksParameters& WalksParameters::set_return_weight(double w) {
  single_.weights().set_return_weight(w);
  return *this;
}

WalksParameters& WalksParameters::set_explore_weight(double w) {
  single_.weights().set_explore_weight(w);
  return *this;
}

WalksParameters& WalksParameters::set_change_node_type_weight(double w) {
  single_.weights().set_change_node_type_weight(w);
  return *this;
}

WalksParameters& WalksParameters::set_change_edge_type_weight(double w) {
  single_.weights().set_change_edge_type_weight(w);
  return *this;
}

WalksParameters& WalksParameters::set_no_traps(bool no_traps) noexcept {
  no_traps_ = no_traps;
  return *this;
}

} // namespace ensgraph::core
