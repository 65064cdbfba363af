/* Core type aliases and sentinel constants.
 *
 * - NodeId: dense unsigned 32-bit node identifier in [0, N)
 * - EdgeId: dense unsigned 64-bit directed edge identifier in [0, E)
 * - Weight: edge weight (float32, compact per-edge payload)
 * - NodeTypeId/EdgeTypeId: dense ids into the type vocabularies
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace ensgraph::core {

using NodeId = std::uint32_t;
using EdgeId = std::uint64_t;
using Weight = float;
using NodeTypeId = std::uint16_t;
using EdgeTypeId = std::uint16_t;

// Marks a node that was not reached/assigned (components, parents, ...).
inline constexpr NodeId kNodeNotPresent = std::numeric_limits<NodeId>::max();
// Marks an entity without a type in a flat type assignment.
inline constexpr std::uint16_t kNoType = std::numeric_limits<std::uint16_t>::max();

// A (src, dst) pair of node ids.
struct NodePair {
  NodeId src;
  NodeId dst;
  friend bool operator==(const NodePair& a, const NodePair& b) noexcept {
    return a.src == b.src && a.dst == b.dst;
  }
  friend bool operator<(const NodePair& a, const NodePair& b) noexcept {
    return a.src != b.src ? a.src < b.src : a.dst < b.dst;
  }
};

// Hash combine formula shared by the structural hashes.
inline void hash_combine(std::uint64_t& h, std::uint64_t v) noexcept {
  h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
}

struct NodePairHash {
  std::size_t operator()(const NodePair& k) const noexcept {
    std::uint64_t h = 0;
    hash_combine(h, std::hash<NodeId>{}(k.src));
    hash_combine(h, std::hash<NodeId>{}(k.dst));
    return static_cast<std::size_t>(h);
  }
};

} // namespace ensgraph::core
