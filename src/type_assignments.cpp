/*
  TypeAssignments: compact node/edge type storage.

  The flat layout needs no offsets; the multi-label layout is a CSR over
  entities. Both expose the same `types_of` view.
*/
#include "ensgraph/core/type_assignments.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "ensgraph/core/error.hpp"

namespace ensgraph::core {

TypeAssignments TypeAssignments::from_lists(
    TypeVocabulary vocabulary,
    const std::vector<std::vector<std::uint16_t>>& per_entity) {
  const auto n_types = vocabulary.size();
  bool multilabel = false;
  for (const auto& lst : per_entity) {
    if (lst.size() > 1) multilabel = true;
    for (auto t : lst) {
      if (t == kNoType || static_cast<std::size_t>(t) >= n_types) {
        throw MalformedInput("type id " + std::to_string(t) + " is not in the type vocabulary of size " +
                             std::to_string(n_types));
      }
    }
  }
  TypeAssignments ta;
  ta.vocabulary_ = std::move(vocabulary);
  ta.num_entities_ = per_entity.size();
  if (!multilabel) {
    ta.ids_.resize(per_entity.size(), kNoType);
    for (std::size_t i = 0; i < per_entity.size(); ++i) {
      if (!per_entity[i].empty()) ta.ids_[i] = per_entity[i][0];
    }
    return ta;
  }
  // Lists are sorted and deduplicated so that equal assignments compare equal.
  ta.offsets_.assign(per_entity.size() + 1, 0);
  std::vector<std::uint16_t> sorted;
  for (std::size_t i = 0; i < per_entity.size(); ++i) {
    sorted.assign(per_entity[i].begin(), per_entity[i].end());
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    ta.ids_.insert(ta.ids_.end(), sorted.begin(), sorted.end());
    ta.offsets_[i + 1] = ta.ids_.size();
  }
  return ta;
}

TypeAssignments TypeAssignments::flat(TypeVocabulary vocabulary, std::vector<std::uint16_t> ids) {
  for (auto t : ids) {
    if (t != kNoType && static_cast<std::size_t>(t) >= vocabulary.size()) {
      throw MalformedInput("type id " + std::to_string(t) + " is not in the type vocabulary of size " +
                           std::to_string(vocabulary.size()));
    }
  }
  TypeAssignments ta;
  ta.vocabulary_ = std::move(vocabulary);
  ta.num_entities_ = ids.size();
  ta.ids_ = std::move(ids);
  return ta;
}

std::span<const std::uint16_t> TypeAssignments::types_of(std::size_t entity) const noexcept {
  if (offsets_.empty()) {
    if (ids_[entity] == kNoType) return {};
    return std::span<const std::uint16_t>(&ids_[entity], 1);
  }
  auto b = static_cast<std::size_t>(offsets_[entity]);
  auto e = static_cast<std::size_t>(offsets_[entity + 1]);
  return std::span<const std::uint16_t>(ids_.data() + b, e - b);
}

std::uint64_t TypeAssignments::num_untyped() const noexcept {
  std::uint64_t c = 0;
  if (offsets_.empty()) {
    for (auto t : ids_) c += (t == kNoType);
  } else {
    for (std::size_t i = 0; i < num_entities_; ++i) c += (offsets_[i] == offsets_[i + 1]);
  }
  return c;
}

std::vector<std::uint64_t> TypeAssignments::type_counts() const {
  std::vector<std::uint64_t> counts(vocabulary_.size(), 0);
  for (auto t : ids_) {
    if (t != kNoType) counts[t]++;
  }
  return counts;
}

TypeAssignments TypeAssignments::reordered(std::span<const std::size_t> order) const {
  if (offsets_.empty()) {
    std::vector<std::uint16_t> ids(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) ids[i] = ids_[order[i]];
    return flat(vocabulary_, std::move(ids));
  }
  std::vector<std::vector<std::uint16_t>> lists(order.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    auto ts = types_of(order[i]);
    lists[i].assign(ts.begin(), ts.end());
  }
  return from_lists(vocabulary_, lists);
}

std::uint64_t TypeAssignments::hash() const noexcept {
  std::uint64_t h = num_entities_;
  for (const auto& k : vocabulary_.keys()) hash_combine(h, std::hash<std::string>{}(k));
  for (auto t : ids_) hash_combine(h, t);
  for (auto o : offsets_) hash_combine(h, o);
  return h;
}

} // namespace ensgraph::core
