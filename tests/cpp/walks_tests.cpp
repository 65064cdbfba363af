#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/walks.hpp"
#include "test_utils.hpp"

using namespace ensgraph::core;
using namespace ensgraph::core::test;

namespace {

void expect_valid_walk(const Graph& g, const std::vector<NodeId>& walk, std::uint64_t max_length) {
  ASSERT_FALSE(walk.empty());
  EXPECT_LE(walk.size(), max_length);
  for (std::size_t i = 1; i < walk.size(); ++i) {
    EXPECT_TRUE(g.has_edge(walk[i - 1], walk[i])) << walk[i - 1] << " -> " << walk[i];
  }
  // A short walk must end on a trap.
  if (walk.size() < max_length) EXPECT_TRUE(g.is_trap(walk.back()));
}

} // namespace

TEST(WalkParameters, WeightsMustBePositiveAndFinite) {
  EXPECT_THROW(WalkWeights(0.0), MalformedInput);
  EXPECT_THROW(WalkWeights(-1.0), MalformedInput);
  EXPECT_THROW(WalkWeights(1.0, std::numeric_limits<double>::quiet_NaN()), MalformedInput);
  EXPECT_THROW(WalkWeights(1.0, 1.0, std::numeric_limits<double>::infinity()), MalformedInput);
  EXPECT_NO_THROW(WalkWeights(1.0));
  EXPECT_TRUE(WalkWeights(1.0).is_first_order_walk());
  EXPECT_EQ(WalkWeights(1.0), WalkWeights {});

  WalkWeights w;
  w.set_explore_weight(2.0);
  EXPECT_TRUE(w.is_node2vec_walk());
  EXPECT_FALSE(w.is_first_order_walk());
  EXPECT_THROW(w.set_return_weight(0.0), MalformedInput);
  EXPECT_DOUBLE_EQ(w.return_weight(), 1.0);
}

TEST(WalkParameters, BuilderDefaultsAndValidation) {
  WalksParameters p;
  EXPECT_EQ(p.walk_length(), 32u);
  EXPECT_EQ(p.iterations(), 1u);
  EXPECT_EQ(p.random_state(), splitmix64(42));
  EXPECT_EQ(p.single_walk_parameters().max_neighbours(), std::optional<NodeId> {100});
  EXPECT_FALSE(p.no_traps());
  EXPECT_TRUE(p.is_first_order_walk());

  EXPECT_THROW(WalksParameters(0), MalformedInput);
  EXPECT_THROW(p.set_iterations(0), MalformedInput);
  EXPECT_THROW(p.set_max_neighbours(NodeId {0}), MalformedInput);
  EXPECT_THROW(p.set_change_edge_type_weight(-2.0), MalformedInput);

  p.set_iterations(3).set_random_state(5).set_return_weight(0.25).set_max_neighbours(std::nullopt);
  EXPECT_EQ(p.iterations(), 3u);
  EXPECT_EQ(p.random_state(), splitmix64(5));
  EXPECT_TRUE(p.is_node2vec_walk());
  EXPECT_FALSE(p.single_walk_parameters().max_neighbours().has_value());
}

TEST(RandomWalks, CompleteWalksStartFromEveryNode) {
  auto g = make_cycle_graph(10);
  RandomWalker walker(g, WalksParameters(5));
  auto walks = walker.complete_walks().collect();
  ASSERT_EQ(walks.size(), 10u);
  for (NodeId i = 0; i < 10; ++i) {
    EXPECT_EQ(walks[i].front(), i);
    EXPECT_EQ(walks[i].size(), 5u);
    expect_valid_walk(g, walks[i], 5);
  }
}

TEST(RandomWalks, TrapsEndWalks) {
  auto g = make_path_graph(3, true);
  RandomWalker walker(g, WalksParameters(10));
  EXPECT_EQ(walker.walk_from(0, 1), (std::vector<NodeId> {0, 1, 2}));
  EXPECT_EQ(walker.walk_from(2, 1), (std::vector<NodeId> {2}));
  EXPECT_THROW((void)walker.walk_from(3, 1), InvalidNodeId);
}

TEST(RandomWalks, NoTrapsSkipsTrapStarts) {
  auto g = make_star_graph(5, true);
  RandomWalker walker(g, WalksParameters(4).set_no_traps(true));
  EXPECT_EQ(walker.complete_walks().size(), 1u);
  for (const auto& walk : walker.random_walks(200)) {
    EXPECT_EQ(walk.front(), 0u);
    EXPECT_EQ(walk.size(), 2u);
  }
}

TEST(RandomWalks, SequencesAreDeterministicAndRestartable) {
  auto g = Graph::from_integer_edges(200, scrambled_edges(200, 1000, 8), undirected_options());
  auto params = WalksParameters(12).set_iterations(2).set_random_state(77);
  RandomWalker walker(g, params);
  auto sequence = walker.random_walks(50);
  ASSERT_EQ(sequence.size(), 100u);

  const auto serial = sequence.collect(ParallelContext {1});
  EXPECT_EQ(sequence.collect(ParallelContext {4}), serial);
  EXPECT_EQ(RandomWalker(g, params).random_walks(50).collect(), serial);

  std::size_t i = 0;
  for (const auto& walk : sequence) {
    ASSERT_LT(i, serial.size());
    EXPECT_EQ(walk, serial[i]);
    expect_valid_walk(g, walk, 12);
    ++i;
  }
  EXPECT_EQ(i, serial.size());
  EXPECT_EQ(sequence.at(57), serial[57]);
  EXPECT_THROW((void)sequence.at(100), std::out_of_range);

  // Iterations repeat the start nodes of the first round.
  for (std::size_t k = 0; k < 50; ++k) EXPECT_EQ(serial[k].front(), serial[k + 50].front());

  auto other = RandomWalker(g, WalksParameters(12).set_iterations(2).set_random_state(78)).random_walks(50).collect();
  EXPECT_NE(other, serial);
}

TEST(RandomWalks, SecondOrderWalksOnWeightedTypedGraphs) {
  std::vector<EdgeRecord> edges;
  for (int i = 0; i < 30; ++i) {
    const auto a = std::to_string(i);
    edges.push_back(edge(a, std::to_string((i + 1) % 30), i % 2 ? "odd" : "even", 1.0F + static_cast<float>(i % 3)));
    edges.push_back(edge(a, std::to_string((i + 7) % 30), "skip", 0.5F));
  }
  auto g = Graph::from_unsorted_edges(edges, std::nullopt, undirected_options());
  auto params = WalksParameters(20)
                    .set_return_weight(4.0)
                    .set_explore_weight(0.5)
                    .set_change_edge_type_weight(2.0)
                    .set_random_state(3);
  RandomWalker walker(g, params);
  for (const auto& walk : walker.complete_walks().collect()) expect_valid_walk(g, walk, 20);
}

namespace {

// Share of second steps that go back to the start node, over walks of three
// nodes from the middle of a path.
double return_share(const WalksParameters& params) {
  auto g = make_path_graph(50);
  RandomWalker walker(g, params);
  int returns = 0;
  const int walks = 400;
  for (int s = 0; s < walks; ++s) {
    const auto walk = walker.walk_from(25, splitmix64(static_cast<std::uint64_t>(s)));
    if (walk.size() == 3 && walk[2] == walk[0]) ++returns;
  }
  return static_cast<double>(returns) / walks;
}

// Undirected 20-clique; node i has type "even"/"odd" by parity, and the edge
// {i, j} has type "same" when i and j share parity, "mixed" otherwise.
Graph make_parity_clique(bool node_types, bool edge_types) {
  std::vector<NodeRecord> nodes;
  for (int i = 0; i < 20; ++i) {
    NodeRecord record {std::to_string(i)};
    if (node_types) record.node_types.push_back(i % 2 ? "odd" : "even");
    nodes.push_back(record);
  }
  std::vector<EdgeRecord> edges;
  for (int i = 0; i < 20; ++i) {
    for (int j = i + 1; j < 20; ++j) {
      std::optional<std::string> type;
      if (edge_types) type = (i + j) % 2 ? "mixed" : "same";
      edges.push_back(edge(std::to_string(i), std::to_string(j), type));
    }
  }
  return Graph::from_unsorted_edges(edges, std::span<const NodeRecord>(nodes), undirected_options());
}

double same_parity_step_share(const Graph& g, const WalksParameters& params) {
  RandomWalker walker(g, params);
  int same = 0;
  int steps = 0;
  for (const auto& walk : walker.complete_walks().collect()) {
    for (std::size_t k = 1; k < walk.size(); ++k) {
      ++steps;
      if (walk[k] % 2 == walk[k - 1] % 2) ++same;
    }
  }
  return static_cast<double>(same) / steps;
}

// Share of steps taken along an edge of the same type as the previous step.
double repeated_edge_type_share(const Graph& g, const WalksParameters& params) {
  RandomWalker walker(g, params);
  int repeated = 0;
  int steps = 0;
  for (const auto& walk : walker.complete_walks().collect()) {
    for (std::size_t k = 2; k < walk.size(); ++k) {
      const bool previous_mixed = (walk[k - 2] + walk[k - 1]) % 2 == 1;
      const bool current_mixed = (walk[k - 1] + walk[k]) % 2 == 1;
      ++steps;
      if (previous_mixed == current_mixed) ++repeated;
    }
  }
  return static_cast<double>(repeated) / steps;
}

} // namespace

TEST(RandomWalks, ReturnAndExploreWeightsBiasTheSecondStep) {
  const double neutral = return_share(WalksParameters(3).set_random_state(11));
  const double returning = return_share(WalksParameters(3).set_random_state(11).set_return_weight(1000.0));
  const double exploring = return_share(WalksParameters(3).set_random_state(11).set_explore_weight(1000.0));
  EXPECT_GT(neutral, 0.3);
  EXPECT_LT(neutral, 0.7);
  EXPECT_GT(returning, 0.95);
  EXPECT_LT(exploring, 0.05);
}

TEST(RandomWalks, ChangeNodeTypeWeightShiftsSameTypeSteps) {
  auto g = make_parity_clique(true, false);
  ASSERT_TRUE(g.has_node_types());
  auto base = WalksParameters(10).set_iterations(5).set_random_state(17);
  const double neutral = same_parity_step_share(g, base);
  const double changing = same_parity_step_share(g, WalksParameters(base).set_change_node_type_weight(1000.0));
  const double staying = same_parity_step_share(g, WalksParameters(base).set_change_node_type_weight(0.001));
  // 9 of the 19 neighbours share the type of the current node.
  EXPECT_GT(neutral, 0.3);
  EXPECT_LT(neutral, 0.65);
  EXPECT_LT(changing, 0.05);
  EXPECT_GT(staying, 0.95);
}

TEST(RandomWalks, ChangeEdgeTypeWeightShiftsRepeatedEdgeTypes) {
  auto g = make_parity_clique(false, true);
  ASSERT_TRUE(g.has_edge_types());
  auto base = WalksParameters(10).set_iterations(5).set_random_state(23);
  const double neutral = repeated_edge_type_share(g, base);
  const double changing = repeated_edge_type_share(g, WalksParameters(base).set_change_edge_type_weight(1000.0));
  const double keeping = repeated_edge_type_share(g, WalksParameters(base).set_change_edge_type_weight(0.001));
  EXPECT_GT(neutral, 0.3);
  EXPECT_LT(neutral, 0.7);
  EXPECT_LT(changing, 0.05);
  EXPECT_GT(keeping, 0.95);
}

TEST(RandomWalks, NeighbourWindowKeepsWalksValid) {
  auto g = make_star_graph(300);
  RandomWalker walker(g, WalksParameters(6).set_max_neighbours(NodeId {10}));
  for (const auto& walk : walker.random_walks(100).collect()) expect_valid_walk(g, walk, 6);
}

TEST(RandomWalks, EmptyGraph) {
  auto g = make_graph(0, {}, false);
  RandomWalker walker(g, WalksParameters(4));
  EXPECT_THROW((void)walker.random_walks(1), MalformedInput);
  EXPECT_TRUE(walker.random_walks(0).empty());
  EXPECT_TRUE(walker.complete_walks().empty());
}
