/* Indexed binary min-heap with decrease-key for weighted traversals. */
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/types.hpp"

namespace ensgraph::core {

// Holds at most one live entry per node id; an index table maps node id to
// heap slot. Equal priorities pop in ascending node id order.
template <typename P>
class DijkstraQueue {
public:
  explicit DijkstraQueue(std::size_t capacity) : slot_(capacity, kAbsent) {}

  // Queue of the given capacity holding `root` at priority zero.
  [[nodiscard]] static DijkstraQueue with_capacity_from_root(std::size_t capacity, NodeId root) {
    DijkstraQueue q(capacity);
    q.push(root, P {});
    return q;
  }

  [[nodiscard]] static DijkstraQueue with_capacity_from_roots(std::size_t capacity, std::span<const NodeId> roots) {
    DijkstraQueue q(capacity);
    for (auto r : roots) q.push(r, P {});
    return q;
  }

  [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }
  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return slot_.size(); }

  [[nodiscard]] bool contains(NodeId node) const noexcept {
    return node < slot_.size() && slot_[node] != kAbsent;
  }
  [[nodiscard]] std::optional<P> priority(NodeId node) const noexcept {
    if (!contains(node)) return std::nullopt;
    return heap_[slot_[node]].first;
  }

  // Inserts `node`, or lowers its priority when already queued. A priority
  // that is not lower than the queued one is ignored.
  // Throws OutOfCapacity when node >= capacity().
  void push(NodeId node, P priority) {
    if (node >= slot_.size()) {
      throw OutOfCapacity("node id " + std::to_string(node) + " exceeds the queue capacity " +
                          std::to_string(slot_.size()));
    }
    auto slot = slot_[node];
    if (slot == kAbsent) {
      heap_.emplace_back(priority, node);
      slot_[node] = heap_.size() - 1;
      sift_up(heap_.size() - 1);
      return;
    }
    if (!(priority < heap_[slot].first)) return;
    heap_[slot].first = priority;
    sift_up(slot);
  }

  // Removes and returns the minimum entry.
  std::optional<std::pair<NodeId, P>> pop_min() {
    if (heap_.empty()) return std::nullopt;
    auto [priority, node] = heap_.front();
    slot_[node] = kAbsent;
    if (heap_.size() > 1) {
      heap_.front() = heap_.back();
      slot_[heap_.front().second] = 0;
      heap_.pop_back();
      sift_down(0);
    } else {
      heap_.pop_back();
    }
    return std::make_pair(node, priority);
  }

private:
  static constexpr std::size_t kAbsent = std::numeric_limits<std::size_t>::max();

  [[nodiscard]] bool less(std::size_t a, std::size_t b) const noexcept {
    if (heap_[a].first < heap_[b].first) return true;
    if (heap_[b].first < heap_[a].first) return false;
    return heap_[a].second < heap_[b].second;
  }

  void swap_slots(std::size_t a, std::size_t b) noexcept {
    std::swap(heap_[a], heap_[b]);
    slot_[heap_[a].second] = a;
    slot_[heap_[b].second] = b;
  }

  void sift_up(std::size_t i) noexcept {
    while (i > 0) {
      const auto parent = (i - 1) / 2;
      if (!less(i, parent)) break;
      swap_slots(i, parent);
      i = parent;
    }
  }

  void sift_down(std::size_t i) noexcept {
    const auto n = heap_.size();
    while (true) {
      auto smallest = i;
      const auto l = 2 * i + 1;
      const auto r = l + 1;
      if (l < n && less(l, smallest)) smallest = l;
      if (r < n && less(r, smallest)) smallest = r;
      if (smallest == i) return;
      swap_slots(i, smallest);
      i = smallest;
    }
  }

  std::vector<std::pair<P, NodeId>> heap_ {};
  std::vector<std::size_t> slot_ {};
};

} // namespace ensgraph::core
