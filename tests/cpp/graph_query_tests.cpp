#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/graph.hpp"
#include "test_utils.hpp"

using namespace ensgraph::core;
using namespace ensgraph::core::test;

TEST(GraphQueries, EncodeDecodeRoundTrip) {
  auto g = make_cycle_graph(17);
  EXPECT_EQ(g.max_encodable_edge_number(), 17u * 17u);
  for (NodeId s = 0; s < g.num_nodes(); ++s) {
    for (NodeId d = 0; d < g.num_nodes(); ++d) {
      EXPECT_EQ(g.decode_edge(g.encode_edge(s, d)), (NodePair {s, d}));
    }
  }
  EXPECT_THROW((void)g.decode_edge(17u * 17u), MalformedInput);
  EXPECT_THROW((void)g.encode_edge(17, 0), InvalidNodeId);
}

TEST(GraphQueries, HasEdgeAgreesWithLinearScan) {
  const NodeId n = 60;
  auto edges = scrambled_edges(n, 400, 99);
  auto g = Graph::from_integer_edges(n, edges, directed_options());
  std::set<std::pair<NodeId, NodeId>> inserted;
  for (const auto& e : edges) inserted.insert({e.src, e.dst});
  for (NodeId s = 0; s < n; ++s) {
    const auto neigh = g.neighbours(s);
    for (NodeId d = 0; d < n; ++d) {
      const bool scanned = std::find(neigh.begin(), neigh.end(), d) != neigh.end();
      EXPECT_EQ(g.has_edge(s, d), scanned);
      EXPECT_EQ(g.has_edge(s, d), inserted.count({s, d}) == 1);
    }
  }
}

TEST(GraphQueries, DegreeStatisticsAndDensity) {
  auto g = make_star_graph(5);
  EXPECT_EQ(g.min_degree(), 1u);
  EXPECT_EQ(g.max_degree(), 4u);
  EXPECT_DOUBLE_EQ(g.mean_degree(), 8.0 / 5.0);
  EXPECT_DOUBLE_EQ(g.median_degree(), 1.0);
  EXPECT_DOUBLE_EQ(g.density(), 8.0 / 20.0);
  EXPECT_DOUBLE_EQ(make_clique(4).density(), 1.0);
}

TEST(GraphQueries, TrapsAndSingletonsOnDirectedGraphs) {
  // 0 -> 1, 2 isolated: 1 is a trap, 2 a singleton trap.
  auto g = make_graph(3, {{0, 1}}, true);
  EXPECT_TRUE(g.has_trap_nodes());
  EXPECT_EQ(g.num_traps(), 2u);
  EXPECT_EQ(g.num_singletons(), 1u);
  EXPECT_TRUE(g.is_trap(1));
  EXPECT_FALSE(g.is_trap(0));
  EXPECT_THROW((void)g.is_trap(3), InvalidNodeId);
}

TEST(GraphQueries, EdgeAccessorsDefaultsAndBounds) {
  auto g = make_path_graph(3);
  EXPECT_FLOAT_EQ(g.edge_weight(0), 1.0F);
  EXPECT_EQ(g.edge_type(0), kNoType);
  EXPECT_THROW((void)g.edge_weight(g.num_directed_edges()), InvalidEdgeId);
  EXPECT_THROW((void)g.edge_node_ids(100), InvalidEdgeId);
  EXPECT_THROW((void)g.node_id("missing"), MalformedInput);
  EXPECT_THROW((void)g.node_name(3), InvalidNodeId);
  const auto [begin, end] = g.minmax_edge_ids(1);
  EXPECT_EQ(end - begin, 2u);
}

TEST(GraphQueries, HashFollowsContent) {
  auto a = make_cycle_graph(8);
  auto b = make_cycle_graph(8);
  auto c = make_path_graph(8);
  EXPECT_EQ(a.hash(), b.hash());
  EXPECT_NE(a.hash(), c.hash());
  EXPECT_NE(a.hash(), a.to_directed().hash());
}

TEST(GraphQueries, TextualReportSummarizesTheGraph) {
  std::vector<EdgeRecord> edges = {edge("a", "b", "road", 3.0F), edge("b", "c", "rail", 1.0F)};
  auto g = Graph::from_unsorted_edges(edges, std::nullopt, undirected_options("transport"));
  const auto report = g.textual_report();
  EXPECT_NE(report.find("transport"), std::string::npos);
  EXPECT_NE(report.find("undirected"), std::string::npos);
  EXPECT_NE(report.find("Nodes: 3"), std::string::npos);
  EXPECT_NE(report.find("Edges: 2"), std::string::npos);
  EXPECT_NE(report.find("Edge types: 2"), std::string::npos);
  EXPECT_NE(report.find("Weights"), std::string::npos);
}
