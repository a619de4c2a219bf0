/**
 * @file test_text_diff.cpp
 * @brief Tests for LCS similarity and unified diff output using Google Test
 */

#include <gtest/gtest.h>
#include "ontodiff/TextDiff.hpp"

using namespace ontodiff;

// ============================================================================
// LCS and similarity
// ============================================================================

TEST(LcsLength, Basics) {
    EXPECT_EQ(lcs_length("", "abc"), 0u);
    EXPECT_EQ(lcs_length("abc", "abc"), 3u);
    EXPECT_EQ(lcs_length("abcd", "acbd"), 3u);
    EXPECT_EQ(lcs_length("abc", "xyz"), 0u);
}

TEST(SimilarityRatio, IgnoresCase) {
    EXPECT_DOUBLE_EQ(similarity_ratio("Amount > 100", "amount > 100"), 1.0);
}

TEST(SimilarityRatio, BothEmptyAreIdentical) {
    EXPECT_DOUBLE_EQ(similarity_ratio("", ""), 1.0);
    EXPECT_DOUBLE_EQ(similarity_ratio("", "x"), 0.0);
}

TEST(SimilarityRatio, PartialOverlap) {
    EXPECT_DOUBLE_EQ(similarity_ratio("abcd", "abce"), 0.75);
    EXPECT_DOUBLE_EQ(similarity_ratio("abc", "xyz"), 0.0);
}

TEST(SimilarityRatio, NearlyEqualConditionsScoreHigh) {
    EXPECT_GT(similarity_ratio("Amount > 10000", "Amount > 50000"), 0.8);
    EXPECT_LT(similarity_ratio("Amount > 10000", "Status = 'VIP'"), 0.5);
}

// ============================================================================
// Edit script
// ============================================================================

TEST(DiffLines, DeletesBeforeInserts) {
    auto script = diff_lines({"a", "b", "c"}, {"a", "x", "c"});

    ASSERT_EQ(script.size(), 4u);
    EXPECT_EQ(script[0].tag, ' ');
    EXPECT_EQ(script[1].tag, '-');
    EXPECT_EQ(script[1].text, "b");
    EXPECT_EQ(script[2].tag, '+');
    EXPECT_EQ(script[2].text, "x");
    EXPECT_EQ(script[3].tag, ' ');
}

TEST(DiffLines, EmptyInputs) {
    EXPECT_TRUE(diff_lines({}, {}).empty());

    auto script = diff_lines({}, {"a", "b"});
    ASSERT_EQ(script.size(), 2u);
    EXPECT_EQ(script[0].tag, '+');
    EXPECT_EQ(script[1].tag, '+');
}

// ============================================================================
// Unified diff
// ============================================================================

TEST(UnifiedDiff, IdenticalInputsProduceNothing) {
    EXPECT_EQ(unified_diff({"a", "b"}, {"a", "b"}, "old", "new"), "");
}

TEST(UnifiedDiff, SingleHunk) {
    const std::string expected =
        "--- old\n"
        "+++ new\n"
        "@@ -1,3 +1,3 @@\n"
        " a\n"
        "-b\n"
        "+x\n"
        " c";
    EXPECT_EQ(unified_diff({"a", "b", "c"}, {"a", "x", "c"}, "old", "new"), expected);
}

TEST(UnifiedDiff, EmptyOldText) {
    const std::string expected =
        "--- old\n"
        "+++ new\n"
        "@@ -0,0 +1 @@\n"
        "+a";
    EXPECT_EQ(unified_diff({}, {"a"}, "old", "new"), expected);
}

TEST(UnifiedDiff, DistantChangesSplitIntoHunks) {
    std::vector<std::string> before;
    for (int i = 0; i < 20; ++i) before.push_back("line" + std::to_string(i));
    std::vector<std::string> after = before;
    after[1] = "changed1";
    after[18] = "changed18";

    const std::string out = unified_diff(before, after, "a", "b");
    EXPECT_NE(out.find("@@ -1,5 +1,5 @@"), std::string::npos);
    EXPECT_NE(out.find("@@ -16,5 +16,5 @@"), std::string::npos);
}

TEST(UnifiedDiff, NearbyChangesShareHunk) {
    std::vector<std::string> before = {"a", "b", "c", "d", "e", "f", "g", "h"};
    std::vector<std::string> after = before;
    after[1] = "B";
    after[6] = "G";

    const std::string out = unified_diff(before, after, "a", "b");
    EXPECT_NE(out.find("@@ -1,8 +1,8 @@"), std::string::npos);
    EXPECT_EQ(out.find("\n@@", out.find("@@ -1,8") + 1), std::string::npos);
}
