/*
  Negative sampling. Rejection rounds draw fixed-size batches in parallel,
  each from its own seed, filter out edges in parallel and merge the
  survivors sequentially in batch order.
*/
#include "ensgraph/core/negative_sampling.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/log.hpp"
#include "ensgraph/core/random.hpp"

namespace ensgraph::core {

namespace {

constexpr std::uint64_t kBatchSize = 1024;
constexpr std::uint64_t kMinAttempts = 1000;
// Largest pair space enumerated for dense requests.
constexpr std::uint64_t kMaxEnumeratedPairs = 1ULL << 24;

bool acceptable(const Graph& g, NodePair p, bool allow_selfloops) {
  if (p.src == p.dst && !allow_selfloops) return false;
  return !g.adjacency().has_edge(p.src, p.dst);
}

std::vector<NodePair> enumerate_and_sample(const Graph& g, const NegativeSamplingOptions& options) {
  std::vector<NodePair> complement;
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    for (NodeId v = g.is_directed() ? 0 : u; v < g.num_nodes(); ++v) {
      if (acceptable(g, {u, v}, options.allow_selfloops)) complement.push_back({u, v});
    }
  }
  Xorshift rng(options.seed);
  const auto count = static_cast<std::size_t>(options.count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto j = i + static_cast<std::size_t>(rng.below(complement.size() - i));
    std::swap(complement[i], complement[j]);
  }
  complement.resize(count);
  return complement;
}

} // namespace

std::uint64_t count_possible_negative_edges(const Graph& g, bool allow_selfloops) {
  const auto n = static_cast<std::uint64_t>(g.num_nodes());
  const auto& csr = g.adjacency();
  std::uint64_t existing = 0;
  for (NodeId u = 0; u < g.num_nodes(); ++u) {
    const auto neigh = csr.get_unchecked_neighbours(u);
    for (std::size_t i = 0; i < neigh.size(); ++i) {
      if (i > 0 && neigh[i] == neigh[i - 1]) continue;
      const auto v = neigh[i];
      if (v == u && !allow_selfloops) continue;
      if (!g.is_directed() && v < u) continue;
      ++existing;
    }
  }
  const std::uint64_t loops = allow_selfloops ? n : 0;
  const std::uint64_t total = g.is_directed() ? n * n - n + loops : n * (n - 1) / 2 + loops;
  return total - existing;
}

std::vector<NodePair> sample_negative_edges(const Graph& g, const NegativeSamplingOptions& options,
                                            const ParallelContext& ctx) {
  const auto possible = count_possible_negative_edges(g, options.allow_selfloops);
  if (options.count > possible) {
    throw OutOfCapacity("requested " + std::to_string(options.count) + " negative edges but graph '" + g.name() +
                        "' only has " + std::to_string(possible));
  }
  if (options.count == 0) return {};

  const auto n = static_cast<std::uint64_t>(g.num_nodes());
  std::vector<NodePair> out;
  if (!options.degree_weighted && options.count * 2 > possible && n * n <= kMaxEnumeratedPairs) {
    ENSGRAPH_DEBUG("negative sampling on '", g.name(), "': enumerating the complement for a dense request");
    out = enumerate_and_sample(g, options);
    std::sort(out.begin(), out.end());
    return out;
  }
  if (options.degree_weighted && g.num_directed_edges() == 0) {
    throw OutOfCapacity("degree-weighted negative sampling needs at least one edge");
  }

  const auto& csr = g.adjacency();
  const auto m = g.num_directed_edges();
  const auto max_attempts = std::max(options.count * std::max<std::uint64_t>(options.max_attempts_factor, 1), kMinAttempts);
  std::unordered_set<NodePair, NodePairHash> seen;
  seen.reserve(static_cast<std::size_t>(options.count));
  out.reserve(static_cast<std::size_t>(options.count));

  std::uint64_t attempts = 0;
  std::uint64_t next_batch = 0;
  while (out.size() < options.count) {
    if (attempts >= max_attempts) {
      throw OutOfCapacity("negative sampling on '" + g.name() + "' found " + std::to_string(out.size()) + " of " +
                          std::to_string(options.count) + " edges within " + std::to_string(max_attempts) +
                          " attempts");
    }
    const auto missing = options.count - out.size();
    const auto batches = static_cast<std::int64_t>((missing + missing / 4 + kBatchSize - 1) / kBatchSize);
    std::vector<std::vector<NodePair>> found(static_cast<std::size_t>(batches));
#pragma omp parallel for schedule(dynamic, 1) num_threads(ctx.threads())
    for (std::int64_t b = 0; b < batches; ++b) {
      Xorshift rng(splitmix64(options.seed + next_batch + static_cast<std::uint64_t>(b)));
      auto& local = found[static_cast<std::size_t>(b)];
      for (std::uint64_t i = 0; i < kBatchSize; ++i) {
        NodePair p {};
        if (options.degree_weighted) {
          p.src = csr.get_unchecked_source(rng.below(m));
          p.dst = csr.get_unchecked_destination(rng.below(m));
        } else {
          p.src = static_cast<NodeId>(rng.below(n));
          p.dst = static_cast<NodeId>(rng.below(n));
        }
        if (!g.is_directed() && p.dst < p.src) std::swap(p.src, p.dst);
        if (acceptable(g, p, options.allow_selfloops)) local.push_back(p);
      }
    }
    next_batch += static_cast<std::uint64_t>(batches);
    attempts += static_cast<std::uint64_t>(batches) * kBatchSize;
    for (const auto& local : found) {
      for (auto p : local) {
        if (out.size() == options.count) break;
        if (seen.insert(p).second) out.push_back(p);
      }
    }
  }
  ENSGRAPH_DEBUG("negative sampling on '", g.name(), "': ", out.size(), " edges after ", attempts, " draws");
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace ensgraph::core
