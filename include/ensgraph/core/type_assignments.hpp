/* Per-entity node/edge type ids with their vocabulary.
 *
 * Stored flat (one slot per entity, kNoType for untyped) when no entity has
 * more than one type, otherwise as offsets (length n+1) plus a flat id list.
 */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "ensgraph/core/types.hpp"
#include "ensgraph/core/vocabulary.hpp"

namespace ensgraph::core {

class TypeAssignments {
public:
  TypeAssignments() = default;

  // Picks the flat layout when every list has at most one element.
  // Throws MalformedInput on ids outside the vocabulary.
  [[nodiscard]] static TypeAssignments from_lists(
      TypeVocabulary vocabulary,
      const std::vector<std::vector<std::uint16_t>>& per_entity);

  // One type (or kNoType) per entity.
  [[nodiscard]] static TypeAssignments flat(TypeVocabulary vocabulary,
                                            std::vector<std::uint16_t> ids);

  [[nodiscard]] std::size_t num_entities() const noexcept { return num_entities_; }
  [[nodiscard]] bool is_multilabel() const noexcept { return !offsets_.empty(); }
  [[nodiscard]] const TypeVocabulary& vocabulary() const noexcept { return vocabulary_; }
  [[nodiscard]] std::size_t num_types() const noexcept { return vocabulary_.size(); }

  // Types of an entity; empty span when untyped. No bounds check.
  [[nodiscard]] std::span<const std::uint16_t> types_of(std::size_t entity) const noexcept;

  // Flat layout only: the single type slot, kNoType if untyped.
  [[nodiscard]] std::uint16_t single_type_of(std::size_t entity) const noexcept {
    return ids_[entity];
  }

  [[nodiscard]] std::uint64_t num_untyped() const noexcept;
  // Number of entities carrying each type id.
  [[nodiscard]] std::vector<std::uint64_t> type_counts() const;

  // Same assignment re-indexed: entity i of the result takes the types of
  // entity order[i] of this instance.
  [[nodiscard]] TypeAssignments reordered(std::span<const std::size_t> order) const;

  [[nodiscard]] std::uint64_t hash() const noexcept;

  friend bool operator==(const TypeAssignments& a, const TypeAssignments& b) {
    return a.num_entities_ == b.num_entities_ && a.vocabulary_ == b.vocabulary_ &&
           a.ids_ == b.ids_ && a.offsets_ == b.offsets_;
  }

private:
  TypeVocabulary vocabulary_ {};
  std::size_t num_entities_ {0};
  std::vector<std::uint16_t> ids_ {};
  std::vector<std::uint64_t> offsets_ {};
};

} // namespace ensgraph::core
