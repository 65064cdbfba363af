/*
  EliasFano: construction on sdsl containers, access and rank.

  Layout: element i with high part h sets bit (h + i) of `highs_`; bucket h
  is delimited by the h-th and (h+1)-th zero. sdsl select supports are
  1-based, so the i-th element (0-based) is select_ones_(i + 1).
*/
#include "ensgraph/core/elias_fano.hpp"

#include <bit>
#include <stdexcept>
#include <string>
#include <utility>

#include "ensgraph/core/error.hpp"

namespace ensgraph::core {

EliasFano::EliasFano(const EliasFano& other)
    : size_(other.size_), universe_(other.universe_), low_bits_(other.low_bits_), lows_(other.lows_),
      highs_(other.highs_), select_ones_(other.select_ones_), select_zeros_(other.select_zeros_) {
  bind_supports();
}

EliasFano::EliasFano(EliasFano&& other) noexcept
    : size_(other.size_), universe_(other.universe_), low_bits_(other.low_bits_), lows_(std::move(other.lows_)),
      highs_(std::move(other.highs_)), select_ones_(std::move(other.select_ones_)),
      select_zeros_(std::move(other.select_zeros_)) {
  bind_supports();
}

EliasFano& EliasFano::operator=(const EliasFano& other) {
  if (this != &other) {
    size_ = other.size_;
    universe_ = other.universe_;
    low_bits_ = other.low_bits_;
    lows_ = other.lows_;
    highs_ = other.highs_;
    select_ones_ = other.select_ones_;
    select_zeros_ = other.select_zeros_;
    bind_supports();
  }
  return *this;
}

EliasFano& EliasFano::operator=(EliasFano&& other) noexcept {
  if (this != &other) {
    size_ = other.size_;
    universe_ = other.universe_;
    low_bits_ = other.low_bits_;
    lows_ = std::move(other.lows_);
    highs_ = std::move(other.highs_);
    select_ones_ = std::move(other.select_ones_);
    select_zeros_ = std::move(other.select_zeros_);
    bind_supports();
  }
  return *this;
}

void EliasFano::bind_supports() {
  select_ones_.set_vector(&highs_);
  select_zeros_.set_vector(&highs_);
}

EliasFano EliasFano::from_sorted(std::span<const std::uint64_t> values, std::uint64_t universe) {
  EliasFano ef;
  ef.size_ = values.size();
  ef.universe_ = universe;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i] >= universe) {
      throw MalformedInput("value " + std::to_string(values[i]) + " at position " + std::to_string(i) +
                           " is outside the universe " + std::to_string(universe));
    }
    if (i > 0 && values[i] < values[i - 1]) {
      throw MalformedInput("sequence decreases at position " + std::to_string(i));
    }
  }
  if (ef.size_ > 0 && universe > ef.size_) {
    ef.low_bits_ = static_cast<unsigned>(std::bit_width(universe / ef.size_) - 1);
  }
  const std::uint64_t high_len = ef.size_ + (universe >> ef.low_bits_) + 1;
  if (ef.low_bits_ > 0) {
    ef.lows_ = sdsl::int_vector<>(ef.size_, 0, static_cast<std::uint8_t>(ef.low_bits_));
  }
  ef.highs_ = sdsl::bit_vector(high_len, 0);
  const std::uint64_t low_mask = ef.low_bits_ == 0 ? 0 : (1ULL << ef.low_bits_) - 1;
  for (std::uint64_t i = 0; i < ef.size_; ++i) {
    const auto v = values[static_cast<std::size_t>(i)];
    if (ef.low_bits_ > 0) ef.lows_[i] = v & low_mask;
    ef.highs_[(v >> ef.low_bits_) + i] = 1;
  }
  sdsl::util::init_support(ef.select_ones_, &ef.highs_);
  sdsl::util::init_support(ef.select_zeros_, &ef.highs_);
  return ef;
}

std::uint64_t EliasFano::get_unchecked(std::uint64_t index) const {
  const auto high = static_cast<std::uint64_t>(select_ones_(index + 1)) - index;
  return (high << low_bits_) | low(index);
}

std::uint64_t EliasFano::at(std::uint64_t index) const {
  if (index >= size_) {
    throw std::out_of_range("Elias-Fano index " + std::to_string(index) + " is out of range, size is " +
                            std::to_string(size_));
  }
  return get_unchecked(index);
}

std::uint64_t EliasFano::rank(std::uint64_t value) const {
  if (value >= universe_) return size_;
  const auto high = value >> low_bits_;
  const auto value_low = low_bits_ == 0 ? 0 : value & ((1ULL << low_bits_) - 1);
  // First position of bucket `high` is just past its preceding zero.
  std::uint64_t pos = high == 0 ? 0 : static_cast<std::uint64_t>(select_zeros_(high)) + 1;
  std::uint64_t index = pos - high;
  while (pos < highs_.size() && highs_[pos]) {
    if (low(index) >= value_low) break;
    ++pos;
    ++index;
  }
  return index;
}

std::optional<std::uint64_t> EliasFano::index_of(std::uint64_t value) const {
  const auto r = rank(value);
  if (r < size_ && get_unchecked(r) == value) return r;
  return std::nullopt;
}

bool EliasFano::contains(std::uint64_t value) const {
  return index_of(value).has_value();
}

void EliasFano::decode_range(std::uint64_t begin, std::uint64_t end, std::vector<std::uint64_t>& out) const {
  if (end > size_) end = size_;
  if (begin >= end) return;
  out.reserve(out.size() + static_cast<std::size_t>(end - begin));
  auto pos = static_cast<std::uint64_t>(select_ones_(begin + 1));
  for (std::uint64_t i = begin; i < end; ++i) {
    while (!highs_[pos]) ++pos;
    out.push_back(((pos - i) << low_bits_) | low(i));
    ++pos;
  }
}

std::vector<std::uint64_t> EliasFano::decode() const {
  std::vector<std::uint64_t> out;
  decode_range(0, size_, out);
  return out;
}

std::size_t EliasFano::memory_bytes() const {
  return static_cast<std::size_t>(sdsl::size_in_bytes(lows_) + sdsl::size_in_bytes(highs_) +
                                  sdsl::size_in_bytes(select_ones_) + sdsl::size_in_bytes(select_zeros_));
}

} // namespace ensgraph::core
