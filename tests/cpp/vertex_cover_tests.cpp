#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "ensgraph/core/vertex_cover.hpp"
#include "test_utils.hpp"

using namespace ensgraph::core;
using namespace ensgraph::core::test;

namespace {
void expect_cover(const Graph& g, const std::vector<NodeId>& cover) {
  EXPECT_TRUE(std::is_sorted(cover.begin(), cover.end()));
  std::vector<bool> in_cover(g.num_nodes(), false);
  for (auto v : cover) in_cover[v] = true;
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    for (auto v : g.neighbours(u)) EXPECT_TRUE(in_cover[u] || in_cover[v]) << u << " -> " << v;
  }
}
} // namespace

TEST(VertexCover, CoversEveryEdge) {
  for (bool directed : {false, true}) {
    auto g = Graph::from_integer_edges(400, scrambled_edges(400, 1200, 23),
                                       directed ? directed_options() : undirected_options());
    expect_cover(g, approximated_vertex_cover(g));
  }
}

TEST(VertexCover, StarNeedsTwoNodesAtMost) {
  auto g = make_star_graph(20);
  auto cover = approximated_vertex_cover(g);
  expect_cover(g, cover);
  EXPECT_EQ(cover, (std::vector<NodeId> {0, 1}));
}

TEST(VertexCover, SelfLoopsAndIsolatedNodes) {
  auto g = make_graph(4, {{2, 2}}, false);
  EXPECT_EQ(approximated_vertex_cover(g), (std::vector<NodeId> {2}));
  EXPECT_TRUE(approximated_vertex_cover(make_graph(3, {}, false)).empty());
}
