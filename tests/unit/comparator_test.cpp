#include <gtest/gtest.h>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hwsuite/check/comparator.hpp"

namespace hwsuite::check {
namespace {

class ComparatorTest : public ::testing::Test {
 protected:
  OutputComparator comparator_;
};

// =============================================================================
// Tab Expansion
// =============================================================================

TEST_F(ComparatorTest, ExpandTabsUsesEightColumnStops) {
  EXPECT_EQ(ExpandTabs("a\tb"), "a       b");
  EXPECT_EQ(ExpandTabs("abcdefgh\tx"), "abcdefgh        x");
  EXPECT_EQ(ExpandTabs("\t\n\tz"), "        \n        z");
}

TEST_F(ComparatorTest, TabExpandedCaptureMatches) {
  auto result = comparator_.Compare("x\ty\n", "x       y\n");
  EXPECT_TRUE(result.matched);
  EXPECT_EQ(result.comparisons, 2);
}

TEST_F(ComparatorTest, RawExpectedTriedFirst) {
  auto result = comparator_.Compare("x\ty\n", "x\ty\n");
  EXPECT_TRUE(result.matched);
  EXPECT_EQ(result.comparisons, 1);
}

TEST_F(ComparatorTest, NoTabMeansSingleCandidate) {
  auto candidates = comparator_.ExpectedCandidates("plain\n", "other\n");
  EXPECT_EQ(candidates.size(), 1U);
}

TEST_F(ComparatorTest, CapturedTextIsNeverExpanded) {
  // A subject that prints a tab where spaces are expected must fail.
  auto result = comparator_.Compare("x       y\n", "x\ty\n");
  EXPECT_FALSE(result.matched);
}

// =============================================================================
// Line Endings
// =============================================================================

TEST_F(ComparatorTest, CrlfCaptureMatches) {
  auto result = comparator_.Compare("a\nb\n", "a\r\nb\r\n");
  EXPECT_TRUE(result.matched);
}

TEST_F(ComparatorTest, TabsAndCrlfCombine) {
  auto result = comparator_.Compare("a\tb\n", "a       b\r\n");
  EXPECT_TRUE(result.matched);
}

TEST_F(ComparatorTest, MismatchReported) {
  auto result = comparator_.Compare("Sum = 4\n", "Sum = 3\n");
  EXPECT_FALSE(result.matched);
  EXPECT_EQ(result.expected_candidate, "Sum = 4\n");
}

// =============================================================================
// Custom Strategies
// =============================================================================

TEST_F(ComparatorTest, CustomTransformIsApplied) {
  ExpectedTransform upper = [](std::string_view expected, std::string_view)
      -> std::optional<std::string> {
    std::string out(expected);
    for (auto& ch : out) {
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
  };
  OutputComparator comparator(std::vector<ExpectedTransform>{upper});
  EXPECT_TRUE(comparator.Compare("hello\n", "HELLO\n").matched);
  EXPECT_FALSE(comparator.Compare("hello\n", "Hello\n").matched);
}

TEST_F(ComparatorTest, NoTransformsMeansExactMatchOnly) {
  OutputComparator comparator(std::vector<ExpectedTransform>{});
  EXPECT_FALSE(comparator.Compare("a\tb", "a       b").matched);
}

}  // namespace
}  // namespace hwsuite::check
