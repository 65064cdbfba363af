/* Seeded pseudo-random helpers (splitmix64 seeding, xorshift64 stepping).
 *
 * Every randomized algorithm derives its per-item state from an explicit seed
 * and an item index, so results do not depend on thread scheduling.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ensgraph::core {

[[nodiscard]] constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

[[nodiscard]] constexpr std::uint64_t xorshift64(std::uint64_t x) noexcept {
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  return x;
}

// Small stateful generator; the state is never zero.
class Xorshift {
public:
  explicit Xorshift(std::uint64_t seed) noexcept : state_(splitmix64(seed) | 1ULL) {}

  std::uint64_t next() noexcept {
    state_ = xorshift64(state_);
    return state_;
  }

  // Uniform integer in [0, bound); bound must be > 0.
  std::uint64_t below(std::uint64_t bound) noexcept { return next() % bound; }

  // Uniform double in [0, 1).
  double unit() noexcept { return static_cast<double>(next() >> 11) * 0x1.0p-53; }

private:
  std::uint64_t state_;
};

// Samples an index proportionally to non-negative weights. The span must be
// non-empty with a strictly positive sum.
template <typename T>
[[nodiscard]] std::size_t sample_weighted(std::span<const T> weights, Xorshift& rng) {
  double total = 0.0;
  for (auto w : weights) total += static_cast<double>(w);
  double target = rng.unit() * total;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    target -= static_cast<double>(weights[i]);
    if (target < 0.0) return i;
  }
  // Rounding may leave a tiny positive residue; fall back to the last
  // strictly positive weight.
  for (std::size_t i = weights.size(); i-- > 0;) {
    if (weights[i] > 0) return i;
  }
  return weights.size() - 1;
}

} // namespace ensgraph::core
