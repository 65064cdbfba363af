#include <gtest/gtest.h>

#include <vector>

#include "ensgraph/core/dijkstra_queue.hpp"
#include "ensgraph/core/error.hpp"

using namespace ensgraph::core;

TEST(DijkstraQueue, PopsInPriorityOrder) {
  DijkstraQueue<double> q(8);
  q.push(4, 3.0);
  q.push(1, 1.5);
  q.push(6, 0.5);
  q.push(2, 2.0);
  EXPECT_EQ(q.size(), 4u);
  std::vector<NodeId> order;
  while (auto e = q.pop_min()) order.push_back(e->first);
  EXPECT_EQ(order, (std::vector<NodeId> {6, 1, 2, 4}));
  EXPECT_TRUE(q.empty());
  EXPECT_FALSE(q.pop_min().has_value());
}

TEST(DijkstraQueue, DecreaseKeyAndIgnoredIncrease) {
  DijkstraQueue<double> q(4);
  q.push(0, 5.0);
  q.push(1, 3.0);
  q.push(0, 1.0);
  EXPECT_EQ(q.size(), 2u);
  EXPECT_DOUBLE_EQ(*q.priority(0), 1.0);
  q.push(1, 9.0);
  EXPECT_DOUBLE_EQ(*q.priority(1), 3.0);
  auto top = q.pop_min();
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(top->first, 0u);
  EXPECT_FALSE(q.contains(0));
  EXPECT_FALSE(q.priority(0).has_value());
}

TEST(DijkstraQueue, TiesPopByNodeId) {
  DijkstraQueue<int> q(10);
  for (NodeId n : {7u, 3u, 9u, 0u}) q.push(n, 2);
  std::vector<NodeId> order;
  while (auto e = q.pop_min()) order.push_back(e->first);
  EXPECT_EQ(order, (std::vector<NodeId> {0, 3, 7, 9}));
}

TEST(DijkstraQueue, CapacityIsEnforced) {
  DijkstraQueue<double> q(3);
  EXPECT_THROW(q.push(3, 1.0), OutOfCapacity);
  const std::vector<NodeId> roots = {0, 2};
  auto seeded = DijkstraQueue<double>::with_capacity_from_roots(3, roots);
  EXPECT_EQ(seeded.size(), 2u);
  EXPECT_EQ(seeded.capacity(), 3u);
  auto single = DijkstraQueue<double>::with_capacity_from_root(3, 1);
  EXPECT_DOUBLE_EQ(*single.priority(1), 0.0);
}
