#include <cstdint>

#include <optional>
#include <string>

#include "gtest/gtest.h"
#include "internal/text/japanese_number_parser.hpp"

namespace kazu::text {

// =============================================================================
// 平假名状态机
// =============================================================================

TEST(HiraganaParserTest, EuphonicUnits) {
    EXPECT_EQ(parseJapaneseNumber("さんびゃく"), 300);
    EXPECT_EQ(parseJapaneseNumber("ろくぴゃく"), 600);
    EXPECT_EQ(parseJapaneseNumber("はちぴゃく"), 800);
    EXPECT_EQ(parseJapaneseNumber("さんぜん"), 3000);
}

TEST(HiraganaParserTest, GroupsWithPauseMarks) {
    EXPECT_EQ(parseJapaneseNumber("いちまん、にせんさんびゃくよんじゅうご"), 12345);
    EXPECT_EQ(parseJapaneseNumber("にせんごひゃくろくじゅう"), 2560);
    EXPECT_EQ(parseJapaneseNumber("さんびゃくまん"), 3000000);
    EXPECT_EQ(parseJapaneseNumber("いちおく、にせんさんびゃくよんじゅうごまん、"
                                  "ろくせんななひゃくはちじゅうきゅう"), 123456789);
}

TEST(HiraganaParserTest, BareUnitsMeanOne) {
    EXPECT_EQ(parseJapaneseNumber("じゅう"), 10);
    EXPECT_EQ(parseJapaneseNumber("ひゃく"), 100);
    EXPECT_EQ(parseJapaneseNumber("せん"), 1000);
    EXPECT_EQ(parseJapaneseNumber("まん"), 10000);
    EXPECT_EQ(parseJapaneseNumber("せんまん"), 10000000);
}

TEST(HiraganaParserTest, AlternateReadings) {
    EXPECT_EQ(parseJapaneseNumber("しせん"), 4000);
    EXPECT_EQ(parseJapaneseNumber("しちひゃく"), 700);
    EXPECT_EQ(parseJapaneseNumber("くじゅう"), 90);
    EXPECT_EQ(parseJapaneseNumber("いっせん"), 1000);
    EXPECT_EQ(parseJapaneseNumber("ろっぴゃく"), 600);
    EXPECT_EQ(parseJapaneseNumber("はっぴゃく"), 800);
    EXPECT_EQ(parseJapaneseNumber("いっちょう"), 1000000000000);
}

TEST(HiraganaParserTest, SkipsUnknownCharacters) {
    EXPECT_EQ(parseJapaneseNumber("えーと さんびゃく"), 300);
    EXPECT_EQ(parseJapaneseNumber("さんびゃくです"), 300);
}

TEST(HiraganaParserTest, NoDigitsIsNoResult) {
    EXPECT_FALSE(parseJapaneseNumber("").has_value());
    EXPECT_FALSE(parseJapaneseNumber("   ").has_value());
    EXPECT_FALSE(parseJapaneseNumber("ありがとう").has_value());
    EXPECT_FALSE(parseJapaneseNumber("abc").has_value());
    EXPECT_FALSE(parseHiraganaNumber("ぜろぜろ").has_value());
}

TEST(HiraganaParserTest, StateStartsEmpty) {
    HiraganaParseState state;
    EXPECT_EQ(state.final_result, 0);
    EXPECT_EQ(state.group_value, 0);
    EXPECT_EQ(state.pending_digit, 0);
}

// =============================================================================
// 零
// =============================================================================

TEST(JapaneseZeroTest, ExplicitZero) {
    EXPECT_EQ(parseJapaneseNumber("ぜろ"), 0);
    EXPECT_EQ(parseJapaneseNumber("れい"), 0);
    EXPECT_EQ(parseJapaneseNumber("零"), 0);
    EXPECT_EQ(parseJapaneseNumber("0"), 0);
    EXPECT_EQ(parseJapaneseNumber("000"), 0);
    EXPECT_EQ(parseJapaneseNumber("０"), 0);
}

// =============================================================================
// 数字/汉字混合
// =============================================================================

TEST(MixedParserTest, Detection) {
    EXPECT_TRUE(isMixedJapaneseNumber("300万"));
    EXPECT_TRUE(isMixedJapaneseNumber("5"));
    EXPECT_TRUE(isMixedJapaneseNumber("億"));
    EXPECT_FALSE(isMixedJapaneseNumber("さんびゃく"));
}

TEST(MixedParserTest, DigitsWithScaleSymbols) {
    EXPECT_EQ(parseJapaneseNumber("300万"), 3000000);
    EXPECT_EQ(parseJapaneseNumber("3億5000万"), 350000000);
    EXPECT_EQ(parseJapaneseNumber("1兆2000億"), 1200000000000);
    EXPECT_EQ(parseJapaneseNumber("1億2345万6789"), 123456789);
    EXPECT_EQ(parseJapaneseNumber("5402"), 5402);
}

TEST(MixedParserTest, BareSymbolMeansOne) {
    EXPECT_EQ(parseJapaneseNumber("万"), 10000);
    EXPECT_EQ(parseJapaneseNumber("億5000"), 100005000);
    // 汉字数字不作系数
    EXPECT_EQ(parseJapaneseNumber("三百万"), 10000);
}

TEST(MixedParserTest, SeparatorsAndFullwidthDigits) {
    EXPECT_EQ(parseJapaneseNumber("2,560"), 2560);
    EXPECT_EQ(parseJapaneseNumber("１２３"), 123);
    EXPECT_EQ(parseJapaneseNumber("３００万"), 3000000);
    EXPECT_EQ(parseJapaneseNumber("1億 2345万 6789"), 123456789);
    EXPECT_EQ(stripJapaneseSeparators("１、２３４"), "1234");
}

TEST(MixedParserTest, OverflowIsNoResult) {
    EXPECT_FALSE(parseJapaneseNumber("9999999999兆").has_value());
    EXPECT_FALSE(parseJapaneseNumber("99999999999999999999").has_value());
    EXPECT_FALSE(parseMixedJapaneseNumber("さんびゃく").has_value());
}

} // namespace kazu::text
