#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "ensgraph/core/error.hpp"
#include "ensgraph/core/type_assignments.hpp"
#include "ensgraph/core/vocabulary.hpp"

using namespace ensgraph::core;

TEST(Vocabulary, InsertingTheSameKeyTwiceReturnsTheSameId) {
  NodeVocabulary v;
  v.insert("alpha");
  const auto before = v.size();
  const auto first = v.insert("beta");
  const auto second = v.insert("beta");
  EXPECT_EQ(first, second);
  EXPECT_EQ(v.size(), before + 1);
}

TEST(Vocabulary, IdsFollowInsertionOrder) {
  NodeVocabulary v;
  EXPECT_EQ(v.insert("x"), 0u);
  EXPECT_EQ(v.insert("y"), 1u);
  EXPECT_EQ(v.insert("z"), 2u);
  EXPECT_EQ(v.translate(1), "y");
  ASSERT_TRUE(v.get("z").has_value());
  EXPECT_EQ(*v.get("z"), 2u);
  EXPECT_FALSE(v.get("w").has_value());
  EXPECT_TRUE(v.contains("x"));
}

TEST(Vocabulary, TranslateOutOfRangeThrows) {
  NodeVocabulary v;
  v.insert("only");
  EXPECT_THROW((void)v.translate(1), std::out_of_range);
}

TEST(Vocabulary, FromKeysRejectsDuplicates) {
  EXPECT_THROW((void)NodeVocabulary::from_keys({"a", "b", "a"}), MalformedInput);
  auto v = NodeVocabulary::from_keys({"a", "b"});
  EXPECT_EQ(v.size(), 2u);
  EXPECT_EQ(v.translate(0), "a");
}

TEST(TypeAssignments, FlatLayoutWhenEveryEntityHasAtMostOneType) {
  auto vocab = TypeVocabulary::from_keys({"red", "blue"});
  auto ta = TypeAssignments::from_lists(vocab, {{0}, {}, {1}});
  EXPECT_FALSE(ta.is_multilabel());
  EXPECT_EQ(ta.num_untyped(), 1u);
  ASSERT_EQ(ta.types_of(2).size(), 1u);
  EXPECT_EQ(ta.types_of(2)[0], 1u);
  EXPECT_TRUE(ta.types_of(1).empty());
}

TEST(TypeAssignments, MultiLabelListsAreSortedAndDeduplicated) {
  auto vocab = TypeVocabulary::from_keys({"a", "b", "c"});
  auto ta = TypeAssignments::from_lists(vocab, {{2, 0, 2}, {1}, {}});
  EXPECT_TRUE(ta.is_multilabel());
  auto t0 = ta.types_of(0);
  ASSERT_EQ(t0.size(), 2u);
  EXPECT_EQ(t0[0], 0u);
  EXPECT_EQ(t0[1], 2u);
  auto counts = ta.type_counts();
  EXPECT_EQ(counts, (std::vector<std::uint64_t> {1, 1, 1}));
  EXPECT_EQ(ta.num_untyped(), 1u);
}

TEST(TypeAssignments, RejectsIdsOutsideTheVocabulary) {
  auto vocab = TypeVocabulary::from_keys({"only"});
  EXPECT_THROW((void)TypeAssignments::from_lists(vocab, {{1}}), MalformedInput);
}

TEST(TypeAssignments, ReorderedFollowsTheGivenOrder) {
  auto vocab = TypeVocabulary::from_keys({"a", "b"});
  auto ta = TypeAssignments::flat(vocab, {0, 1, kNoType});
  std::vector<std::size_t> order = {2, 0, 1};
  auto re = ta.reordered(order);
  EXPECT_TRUE(re.types_of(0).empty());
  EXPECT_EQ(re.single_type_of(1), 0u);
  EXPECT_EQ(re.single_type_of(2), 1u);
}
