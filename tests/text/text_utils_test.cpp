#include <cstdint>

#include <limits>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "internal/text/text_utils.hpp"

namespace kazu::text {

TEST(TextUtilsTest, Utf8CharLength) {
    EXPECT_EQ(utf8CharLength('A'), 1u);
    EXPECT_EQ(utf8CharLength(0xC3), 2u);
    EXPECT_EQ(utf8CharLength(0xE3), 3u);
    EXPECT_EQ(utf8CharLength(0xF0), 4u);
}

TEST(TextUtilsTest, SplitUtf8ByCodePoint) {
    std::vector<std::string> expected = {"a", "あ", "１", "万"};
    EXPECT_EQ(splitUtf8("aあ１万"), expected);
    EXPECT_TRUE(splitUtf8("").empty());
}

TEST(TextUtilsTest, CharacterClasses) {
    EXPECT_TRUE(isDigit("7"));
    EXPECT_FALSE(isDigit("７"));
    EXPECT_FALSE(isDigit("a"));

    EXPECT_TRUE(isWhitespace(" "));
    EXPECT_TRUE(isWhitespace("\t"));
    EXPECT_TRUE(isWhitespace("　"));
    EXPECT_FALSE(isWhitespace("a"));

    EXPECT_TRUE(isPunctuation("、"));
    EXPECT_TRUE(isPunctuation("。"));
    EXPECT_TRUE(isPunctuation(","));
    EXPECT_TRUE(isPunctuation("-"));
    // 长音符号属于读音的一部分
    EXPECT_FALSE(isPunctuation("ー"));
    EXPECT_FALSE(isPunctuation("ま"));
}

TEST(TextUtilsTest, LowerAndTrim) {
    EXPECT_EQ(toLowerAscii("Two HUNDRED"), "two hundred");
    EXPECT_EQ(toLowerAscii("さんびゃくA"), "さんびゃくa");
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_EQ(trim("   "), "");
}

TEST(TextUtilsTest, FoldFullwidthDigits) {
    EXPECT_EQ(foldFullwidthDigits("１２３万"), "123万");
    EXPECT_EQ(foldFullwidthDigits("０９"), "09");
    EXPECT_EQ(foldFullwidthDigits("ｘ"), "ｘ");
}

TEST(TextUtilsTest, IsAllDigits) {
    EXPECT_TRUE(isAllDigits("0123"));
    EXPECT_FALSE(isAllDigits(""));
    EXPECT_FALSE(isAllDigits("12a"));
    EXPECT_FALSE(isAllDigits("1,000"));
}

TEST(TextUtilsTest, ParseDecimal) {
    EXPECT_EQ(parseDecimal("2560"), 2560);
    EXPECT_EQ(parseDecimal("0007"), 7);
    EXPECT_EQ(parseDecimal("9223372036854775807"), std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(parseDecimal("9223372036854775808").has_value());
    EXPECT_FALSE(parseDecimal("").has_value());
    EXPECT_FALSE(parseDecimal("12,3").has_value());
}

} // namespace kazu::text
