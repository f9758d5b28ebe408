#include "gtest/gtest.h"
#include "internal/text/similarity.hpp"

namespace kazu::text {

TEST(LevenshteinTest, AsciiDistance) {
    EXPECT_EQ(levenshteinDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshteinDistance("abc", "abc"), 0u);
    EXPECT_EQ(levenshteinDistance("", "abc"), 3u);
    EXPECT_EQ(levenshteinDistance("abc", ""), 3u);
}

TEST(LevenshteinTest, CountsCodePointsNotBytes) {
    EXPECT_EQ(levenshteinDistance("さんびゃく", "さんぴゃく"), 1u);
    EXPECT_EQ(levenshteinDistance("万", "億"), 1u);
}

TEST(SimilarityTest, Ratio) {
    EXPECT_FLOAT_EQ(similarity("", ""), 1.0f);
    EXPECT_FLOAT_EQ(similarity("abc", ""), 0.0f);
    EXPECT_FLOAT_EQ(similarity("one hundred", "one hundred"), 1.0f);
    EXPECT_NEAR(similarity("さんびゃく", "さんぴゃく"), 0.8f, 1e-6f);
    EXPECT_NEAR(similarity("one hundred", "two hundred"), 8.0f / 11.0f, 1e-6f);
    EXPECT_NEAR(similarity("two thousand five hundred and sixty",
                           "two thousand five hundred sixty"), 31.0f / 35.0f, 1e-6f);
}

} // namespace kazu::text
