/* Bijective mapping between keys and dense unsigned ids.
 *
 * Insertion order defines the id assignment. Construction is single-writer;
 * once built the vocabulary is only read, and const access is safe from any
 * number of threads.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ensgraph/core/error.hpp"

namespace ensgraph::core {

template <typename K, typename Id = std::uint32_t>
class Vocabulary {
public:
  using key_type = K;
  using id_type = Id;

  Vocabulary() = default;

  // Builds a vocabulary whose ids follow the order of `keys`.
  // Throws MalformedInput when a key appears twice.
  [[nodiscard]] static Vocabulary from_keys(std::vector<K> keys) {
    Vocabulary v;
    v.index_.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
      auto [it, inserted] = v.index_.emplace(keys[i], static_cast<Id>(i));
      if (!inserted) {
        throw MalformedInput("duplicate key at position " + std::to_string(i) +
                             " while building a vocabulary");
      }
    }
    v.keys_ = std::move(keys);
    return v;
  }

  // Returns the id of `key`, assigning the next free id on first insertion.
  Id insert(const K& key) {
    auto it = index_.find(key);
    if (it != index_.end()) return it->second;
    auto id = static_cast<Id>(keys_.size());
    index_.emplace(key, id);
    keys_.push_back(key);
    return id;
  }

  [[nodiscard]] std::optional<Id> get(const K& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
  }

  [[nodiscard]] bool contains(const K& key) const { return index_.find(key) != index_.end(); }

  // Throws std::out_of_range when id >= size().
  [[nodiscard]] const K& translate(Id id) const {
    if (static_cast<std::size_t>(id) >= keys_.size()) {
      throw std::out_of_range("vocabulary id " + std::to_string(id) +
                              " is out of range, vocabulary has " +
                              std::to_string(keys_.size()) + " entries");
    }
    return keys_[static_cast<std::size_t>(id)];
  }

  [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
  [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }
  [[nodiscard]] std::span<const K> keys() const noexcept { return keys_; }

  void reserve(std::size_t n) {
    keys_.reserve(n);
    index_.reserve(n);
  }

  friend bool operator==(const Vocabulary& a, const Vocabulary& b) { return a.keys_ == b.keys_; }

private:
  std::vector<K> keys_ {};
  std::unordered_map<K, Id> index_ {};
};

using NodeVocabulary = Vocabulary<std::string, std::uint32_t>;
using TypeVocabulary = Vocabulary<std::string, std::uint16_t>;

} // namespace ensgraph::core
