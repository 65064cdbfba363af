#include <gtest/gtest.h>

#include <vector>

#include "ensgraph/core/connectivity.hpp"
#include "ensgraph/core/error.hpp"
#include "ensgraph/core/spanning_tree.hpp"
#include "ensgraph/core/union_find.hpp"
#include "test_utils.hpp"

using namespace ensgraph::core;
using namespace ensgraph::core::test;

namespace {

// Tree edges are graph edges and join every component without a cycle.
void expect_spanning_forest(const Graph& g, const std::vector<NodePair>& edges, NodeId expected_components) {
  UnionFind uf(g.num_nodes());
  for (const auto& e : edges) {
    EXPECT_TRUE(g.has_edge(e.src, e.dst) || g.has_edge(e.dst, e.src)) << e.src << " " << e.dst;
    EXPECT_TRUE(uf.unite(e.src, e.dst)) << "cycle through " << e.src << " " << e.dst;
  }
  EXPECT_EQ(uf.num_components(), expected_components);
  EXPECT_EQ(edges.size(), g.num_nodes() - expected_components);
}

SpanningTreeOptions seeded(std::uint64_t seed) {
  SpanningTreeOptions o;
  o.seed = seed;
  return o;
}

} // namespace

TEST(SpanningTree, ArborescenceOnConnectedGraph) {
  auto g = make_cycle_graph(10);
  auto parents = spanning_arborescence(g, seeded(7));
  ASSERT_EQ(parents.size(), 10u);
  EXPECT_EQ(parents[0], 0u);
  expect_spanning_forest(g, spanning_tree_edges(parents), 1);
}

TEST(SpanningTree, ArborescenceRootsEveryComponent) {
  auto g = make_two_components();
  auto parents = spanning_arborescence(g, seeded(1));
  EXPECT_EQ(parents[0], 0u);
  EXPECT_EQ(parents[3], 3u);
  EXPECT_EQ(parents[5], 5u);
  expect_spanning_forest(g, spanning_tree_edges(parents), 3);
}

TEST(SpanningTree, ArborescenceIsIndependentOfThreadCount) {
  auto g = Graph::from_integer_edges(3000, scrambled_edges(3000, 12000, 11), undirected_options());
  const auto reference = spanning_arborescence(g, seeded(42), ParallelContext {1});
  for (int threads : {2, 4, 8}) {
    EXPECT_EQ(spanning_arborescence(g, seeded(42), ParallelContext {threads}), reference) << threads << " threads";
  }
  expect_spanning_forest(g, spanning_tree_edges(reference), connected_components(g).count);
}

TEST(SpanningTree, ArborescenceOnMostlySingletonGraphs) {
  // Nodes 0..599 form a star around 0 (a frontier large enough to run in
  // parallel), 600-601-602 a path, 603 has only a self loop, the rest are
  // isolated.
  std::vector<NodePair> edges;
  for (NodeId v = 1; v < 600; ++v) edges.push_back({0, v});
  edges.push_back({600, 601});
  edges.push_back({601, 602});
  edges.push_back({603, 603});
  auto g = Graph::from_integer_edges(20'000, edges, undirected_options());
  const auto reference = spanning_arborescence(g, seeded(9), ParallelContext {1});
  ASSERT_EQ(reference.size(), 20'000u);
  for (NodeId v = 1; v < 600; ++v) EXPECT_EQ(reference[v], 0u);
  EXPECT_EQ(reference[600], 600u);
  EXPECT_EQ(reference[603], 603u);
  for (NodeId v = 604; v < 20'000; ++v) ASSERT_EQ(reference[v], v);
  EXPECT_EQ(spanning_arborescence(g, seeded(9), ParallelContext {4}), reference);
  expect_spanning_forest(g, spanning_tree_edges(reference), 20'000 - 601);
}

TEST(SpanningTree, ArborescenceRejectsDirectedGraphs) {
  auto g = make_path_graph(5, true);
  EXPECT_THROW((void)spanning_arborescence(g, {}), UnsupportedOnDirected);
  auto forest = spanning_arborescence_kruskal(g);
  EXPECT_EQ(forest.num_components, 1u);
  EXPECT_EQ(forest.edges.size(), 4u);
}

TEST(SpanningTree, KruskalVariantsSpanEveryComponent) {
  auto g = make_two_components();
  expect_spanning_forest(g, spanning_arborescence_kruskal(g).edges, 3);
  expect_spanning_forest(g, minimum_spanning_forest(g).edges, 3);
  expect_spanning_forest(g, random_spanning_arborescence_kruskal(g, seeded(3)).edges, 3);
  EXPECT_EQ(random_spanning_arborescence_kruskal(g, seeded(3)).edges,
            random_spanning_arborescence_kruskal(g, seeded(3)).edges);
}

TEST(SpanningTree, MinimumSpanningForestPrefersLightEdges) {
  std::vector<EdgeRecord> edges = {edge("a", "b", std::nullopt, 1.0F), edge("b", "c", std::nullopt, 2.0F),
                                   edge("a", "c", std::nullopt, 10.0F)};
  auto g = Graph::from_unsorted_edges(edges, std::nullopt, undirected_options());
  auto forest = minimum_spanning_forest(g);
  ASSERT_EQ(forest.edges.size(), 2u);
  for (const auto& e : forest.edges) EXPECT_FALSE((e.src == 0 && e.dst == 2) || (e.src == 2 && e.dst == 0));
}

TEST(SpanningTree, UndesiredEdgeTypes) {
  // a-b is the only link to a and carries the undesired type.
  std::vector<EdgeRecord> edges = {edge("a", "b", "bad"), edge("b", "c", "good"), edge("c", "d", "good"),
                                   edge("b", "d", "bad")};
  auto g = Graph::from_unsorted_edges(edges, std::nullopt, undirected_options());
  SpanningTreeOptions options;
  options.undesired_edge_types = {0};

  auto deferred = spanning_arborescence_kruskal(g, options);
  EXPECT_EQ(deferred.num_components, 1u);
  EXPECT_EQ(deferred.edges.back(), (NodePair {0, 1}));

  options.include_all_edge_types = false;
  auto excluded = spanning_arborescence_kruskal(g, options);
  EXPECT_EQ(excluded.num_components, 2u);
  expect_spanning_forest(g, excluded.edges, 2);

  auto parents = spanning_arborescence(g, options);
  EXPECT_EQ(parents[0], 0u);
  EXPECT_EQ(parents[1], 1u);
  EXPECT_EQ(spanning_tree_edges(parents).size(), 2u);
}
