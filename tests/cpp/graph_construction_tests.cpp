#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <span>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/graph.hpp"
#include "test_utils.hpp"

using namespace ensgraph::core;
using namespace ensgraph::core::test;

TEST(GraphConstruction, NamedTypedWeightedUndirected) {
  std::vector<EdgeRecord> edges = {
      edge("a", "b", "friend", 2.0F),
      edge("b", "c", "work", 1.0F),
      edge("c", "a", "friend", 0.5F),
  };
  auto g = Graph::from_unsorted_edges(edges, std::nullopt, undirected_options("people"));
  expect_csr_valid(g.adjacency());
  EXPECT_EQ(g.name(), "people");
  EXPECT_EQ(g.num_nodes(), 3u);
  EXPECT_EQ(g.num_directed_edges(), 6u);
  EXPECT_EQ(g.num_edges(), 3u);
  EXPECT_TRUE(g.has_edge_weights());
  EXPECT_TRUE(g.has_edge_types());
  EXPECT_FALSE(g.has_node_types());
  EXPECT_EQ(g.node_id("a"), 0u);
  EXPECT_EQ(g.node_name(2), "c");

  // Both directions carry the same payload.
  const auto ab = g.edge_id(0, 1);
  const auto ba = g.edge_id(1, 0);
  ASSERT_TRUE(ab && ba);
  EXPECT_FLOAT_EQ(g.edge_weight(*ab), 2.0F);
  EXPECT_FLOAT_EQ(g.edge_weight(*ba), 2.0F);
  EXPECT_EQ(g.edge_type(*ab), g.edge_type(*ba));
  EXPECT_TRUE(g.has_edge_with_type(1, 2, 1));
  EXPECT_FALSE(g.has_edge_with_type(1, 2, 0));
  EXPECT_TRUE(g.has_edge_from_names("c", "b"));
  EXPECT_FALSE(g.has_edge_from_names("c", "nobody"));
}

TEST(GraphConstruction, NodeListFixesOrderAndTypes) {
  std::vector<NodeRecord> nodes = {{"x", {"t1"}}, {"y", {"t1", "t2"}}, {"z", {}}};
  std::vector<EdgeRecord> edges = {edge("y", "x")};
  auto g = Graph::from_unsorted_edges(edges, std::span<const NodeRecord>(nodes), directed_options());
  EXPECT_EQ(g.num_nodes(), 3u);
  EXPECT_EQ(g.node_id("y"), 1u);
  ASSERT_TRUE(g.has_node_types());
  EXPECT_TRUE(g.node_type_assignments()->is_multilabel());
  EXPECT_EQ(g.node_types(1).size(), 2u);
  EXPECT_TRUE(g.node_types(2).empty());
  EXPECT_EQ(g.num_singletons(), 1u);
  EXPECT_EQ(g.num_traps(), 2u);
}

TEST(GraphConstruction, NodeListRejectsUnknownEndpointsAndDuplicates) {
  std::vector<NodeRecord> nodes = {{"x"}, {"y"}};
  std::vector<EdgeRecord> edges = {edge("x", "w")};
  EXPECT_THROW((void)Graph::from_unsorted_edges(edges, std::span<const NodeRecord>(nodes)), MalformedInput);
  std::vector<NodeRecord> twice = {{"x"}, {"x"}};
  std::vector<EdgeRecord> none;
  EXPECT_THROW((void)Graph::from_unsorted_edges(none, std::span<const NodeRecord>(twice)), MalformedInput);
}

TEST(GraphConstruction, WeightsMustBeAllOrNothingAndPositive) {
  std::vector<EdgeRecord> mixed = {edge("a", "b", std::nullopt, 1.0F), edge("b", "c")};
  EXPECT_THROW((void)Graph::from_unsorted_edges(mixed, std::nullopt), MalformedInput);
  for (float bad : {0.0F, -1.0F, std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity()}) {
    std::vector<EdgeRecord> edges = {edge("a", "b", std::nullopt, 1.0F), edge("b", "c", std::nullopt, bad)};
    EXPECT_THROW((void)Graph::from_unsorted_edges(edges, std::nullopt), MalformedInput) << "weight " << bad;
  }
}

TEST(GraphConstruction, DuplicateAndSelfLoopPolicies) {
  std::vector<NodePair> edges = {{0, 1}, {0, 1}, {1, 2}, {2, 2}};
  auto simple = Graph::from_integer_edges(3, edges, directed_options());
  EXPECT_EQ(simple.num_directed_edges(), 3u);

  auto multi_options = directed_options();
  multi_options.skip_duplicates = false;
  auto multi = Graph::from_integer_edges(3, edges, multi_options);
  EXPECT_EQ(multi.num_directed_edges(), 4u);
  EXPECT_EQ(*multi.edge_id(0, 1), 0u);
  EXPECT_EQ(multi.degree(0), 2u);

  auto no_loops_options = directed_options();
  no_loops_options.skip_selfloops = true;
  auto no_loops = Graph::from_integer_edges(3, edges, no_loops_options);
  EXPECT_EQ(no_loops.num_directed_edges(), 2u);
  EXPECT_EQ(no_loops.num_selfloops(), 0u);
}

TEST(GraphConstruction, UndirectedDuplicatesInBothDirectionsCollapse) {
  std::vector<NodePair> edges = {{0, 1}, {1, 0}};
  auto g = Graph::from_integer_edges(2, edges, undirected_options());
  EXPECT_EQ(g.num_directed_edges(), 2u);
  EXPECT_EQ(g.num_edges(), 1u);
}

TEST(GraphConstruction, FromSortedEdgesValidatesOrder) {
  auto nodes = NodeVocabulary::from_keys({"0", "1", "2"});
  std::vector<SortedEdge> sorted = {{0, 1}, {0, 2}, {1, 2}};
  auto g = Graph::from_sorted_edges(nodes, sorted, std::nullopt, directed_options());
  EXPECT_EQ(g.num_directed_edges(), 3u);
  EXPECT_TRUE(g.has_edge(0, 2));

  std::vector<SortedEdge> unsorted = {{1, 2}, {0, 1}};
  EXPECT_THROW((void)Graph::from_sorted_edges(nodes, unsorted, std::nullopt, directed_options()), MalformedInput);

  std::vector<SortedEdge> typed = {{0, 1, 0}};
  EXPECT_THROW((void)Graph::from_sorted_edges(nodes, typed, std::nullopt, directed_options()), MalformedInput);
  auto g_typed = Graph::from_sorted_edges(nodes, typed, TypeVocabulary::from_keys({"t"}), directed_options());
  EXPECT_EQ(g_typed.edge_type(0), 0u);
}

TEST(GraphConstruction, FromIntegerEdgesChecksNodeIds) {
  std::vector<NodePair> edges = {{0, 3}};
  EXPECT_THROW((void)Graph::from_integer_edges(3, edges), InvalidNodeId);
}

TEST(GraphConstruction, ThreadCountDoesNotChangeTheResult) {
  auto edges = scrambled_edges(500, 4000, 5);
  auto one = Graph::from_integer_edges(500, edges, undirected_options(), ParallelContext {1});
  auto many = Graph::from_integer_edges(500, edges, undirected_options(), ParallelContext {4});
  EXPECT_EQ(one, many);
  EXPECT_EQ(one.hash(), many.hash());
}
