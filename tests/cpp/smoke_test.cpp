#include <gtest/gtest.h>

#include <vector>

#include "ensgraph/core/graph.hpp"

using namespace ensgraph::core;

TEST(GraphSmoke, ConstructFromIntegerEdges) {
  std::vector<NodePair> edges = {{0, 1}, {1, 2}};
  EdgeListOptions options;
  options.directed = true;
  auto g = Graph::from_integer_edges(3, edges, options);
  EXPECT_EQ(g.num_nodes(), 3u);
  EXPECT_EQ(g.num_directed_edges(), 2u);
  EXPECT_TRUE(g.is_directed());
  EXPECT_TRUE(g.has_edge(0, 1));
  EXPECT_FALSE(g.has_edge(1, 0));
}

TEST(GraphSmoke, UndirectedMaterializesBothDirections) {
  std::vector<NodePair> edges = {{0, 1}, {1, 2}, {2, 2}};
  auto g = Graph::from_integer_edges(3, edges, EdgeListOptions {});
  EXPECT_EQ(g.num_directed_edges(), 5u);
  EXPECT_EQ(g.num_edges(), 3u);
  EXPECT_EQ(g.num_selfloops(), 1u);
  EXPECT_TRUE(g.has_edge(1, 0));
  EXPECT_TRUE(g.has_edge(2, 1));
}
