/* Elias-Fano encoding of a monotone non-decreasing integer sequence.
 *
 * Each value is split into `low_bits_` explicit low bits, packed in an
 * sdsl::int_vector, and a high part stored in unary in an sdsl::bit_vector
 * (one set bit per element, one zero per bucket). Select support on the
 * high bits gives constant time access and rank. Space is about
 * 2 + log2(universe / size) bits per element.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <sdsl/bit_vectors.hpp>
#include <sdsl/int_vector.hpp>

namespace ensgraph::core {

class EliasFano {
public:
  EliasFano() = default;
  EliasFano(const EliasFano& other);
  EliasFano(EliasFano&& other) noexcept;
  EliasFano& operator=(const EliasFano& other);
  EliasFano& operator=(EliasFano&& other) noexcept;
  ~EliasFano() = default;

  // Throws MalformedInput when values decrease or reach `universe`.
  [[nodiscard]] static EliasFano from_sorted(std::span<const std::uint64_t> values,
                                             std::uint64_t universe);

  [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] std::uint64_t universe() const noexcept { return universe_; }
  [[nodiscard]] unsigned low_bits() const noexcept { return low_bits_; }

  // i-th value, no bounds check.
  [[nodiscard]] std::uint64_t get_unchecked(std::uint64_t index) const;
  // Throws std::out_of_range.
  [[nodiscard]] std::uint64_t at(std::uint64_t index) const;

  // Number of values strictly smaller than `value`.
  [[nodiscard]] std::uint64_t rank(std::uint64_t value) const;
  [[nodiscard]] bool contains(std::uint64_t value) const;
  // Index of the first occurrence of `value`.
  [[nodiscard]] std::optional<std::uint64_t> index_of(std::uint64_t value) const;

  // Appends values [begin, end) to `out` with a single select.
  void decode_range(std::uint64_t begin, std::uint64_t end, std::vector<std::uint64_t>& out) const;
  [[nodiscard]] std::vector<std::uint64_t> decode() const;

  [[nodiscard]] std::size_t memory_bytes() const;

  friend bool operator==(const EliasFano& a, const EliasFano& b) {
    return a.size_ == b.size_ && a.universe_ == b.universe_ && a.low_bits_ == b.low_bits_ &&
           a.lows_ == b.lows_ && a.highs_ == b.highs_;
  }

private:
  [[nodiscard]] std::uint64_t low(std::uint64_t index) const {
    return low_bits_ == 0 ? 0 : static_cast<std::uint64_t>(lows_[index]);
  }
  // Select supports keep a pointer to `highs_`; re-point them after a copy or move.
  void bind_supports();

  std::uint64_t size_ {0};
  std::uint64_t universe_ {0};
  unsigned low_bits_ {0};
  sdsl::int_vector<> lows_ {};
  sdsl::bit_vector highs_ {};
  sdsl::bit_vector::select_1_type select_ones_ {};
  sdsl::bit_vector::select_0_type select_zeros_ {};
};

} // namespace ensgraph::core
