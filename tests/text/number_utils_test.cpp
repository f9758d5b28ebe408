#include <cstdint>

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "internal/text/number_utils.hpp"

namespace kazu::text {

// =============================================================================
// 音便表
// =============================================================================

TEST(JapaneseEuphonyTest, HundredVariants) {
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 3), "びゃく");
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 6), "ぴゃく");
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 8), "ぴゃく");
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 1), "ひゃく");
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 2), "ひゃく");
    EXPECT_EQ(applyJapaneseEuphony("ひゃく", 9), "ひゃく");
}

TEST(JapaneseEuphonyTest, ThousandVariants) {
    EXPECT_EQ(applyJapaneseEuphony("せん", 3), "ぜん");
    EXPECT_EQ(applyJapaneseEuphony("せん", 8), "せん");
    EXPECT_EQ(applyJapaneseEuphony("せん", 1), "せん");
}

TEST(JapaneseEuphonyTest, OtherUnitsUnchanged) {
    for (int digit = 1; digit <= 9; ++digit) {
        EXPECT_EQ(applyJapaneseEuphony("じゅう", digit), "じゅう");
        EXPECT_EQ(applyJapaneseEuphony("まん", digit), "まん");
    }
}

TEST(JapaneseEuphonyTest, UnitSpellings) {
    std::vector<std::string> hundred = {"ひゃく", "びゃく", "ぴゃく"};
    std::vector<std::string> thousand = {"せん", "ぜん"};
    std::vector<std::string> ten = {"じゅう"};
    EXPECT_EQ(japaneseUnitSpellings("ひゃく"), hundred);
    EXPECT_EQ(japaneseUnitSpellings("せん"), thousand);
    EXPECT_EQ(japaneseUnitSpellings("じゅう"), ten);
}

// =============================================================================
// 日语读法
// =============================================================================

TEST(JapaneseReadingTest, DigitReading) {
    EXPECT_EQ(japaneseDigitReading(0), "ぜろ");
    EXPECT_EQ(japaneseDigitReading(4), "よん");
    EXPECT_EQ(japaneseDigitReading(9), "きゅう");
    EXPECT_THROW(japaneseDigitReading(10), std::out_of_range);
}

TEST(JapaneseReadingTest, GroupReading) {
    EXPECT_EQ(japaneseGroupReading(10), "じゅう");
    EXPECT_EQ(japaneseGroupReading(11), "じゅういち");
    EXPECT_EQ(japaneseGroupReading(100), "ひゃく");
    EXPECT_EQ(japaneseGroupReading(300), "さんびゃく");
    EXPECT_EQ(japaneseGroupReading(600), "ろくぴゃく");
    EXPECT_EQ(japaneseGroupReading(1000), "せん");
    EXPECT_EQ(japaneseGroupReading(3000), "さんぜん");
    EXPECT_EQ(japaneseGroupReading(8000), "はちせん");
    EXPECT_EQ(japaneseGroupReading(2560), "にせんごひゃくろくじゅう");
}

TEST(JapaneseReadingTest, MajorUnitsJoinedWithPause) {
    EXPECT_EQ(intToJapaneseReading(0), "ぜろ");
    EXPECT_EQ(intToJapaneseReading(99), "きゅうじゅうきゅう");
    EXPECT_EQ(intToJapaneseReading(10000), "いちまん");
    EXPECT_EQ(intToJapaneseReading(12345), "いちまん、にせんさんびゃくよんじゅうご");
    EXPECT_EQ(intToJapaneseReading(3000000), "さんびゃくまん");
    EXPECT_EQ(intToJapaneseReading(20000005), "にせんまん、ご");
    EXPECT_EQ(intToJapaneseReading(100000001), "いちおく、いち");
}

TEST(JapaneseReadingTest, RejectsOutOfRange) {
    EXPECT_NO_THROW(intToJapaneseReading(kMaxJapaneseValue));
    EXPECT_THROW(intToJapaneseReading(kMaxJapaneseValue + 1), std::out_of_range);
    EXPECT_THROW(intToJapaneseReading(-1), std::out_of_range);
}

TEST(JapaneseGroupedTest, OmitsZeroCoefficients) {
    EXPECT_EQ(formatJapaneseGrouped(0), "0");
    EXPECT_EQ(formatJapaneseGrouped(9999), "9999");
    EXPECT_EQ(formatJapaneseGrouped(10000), "1万");
    EXPECT_EQ(formatJapaneseGrouped(123456789), "1億2345万6789");
    EXPECT_EQ(formatJapaneseGrouped(1000000000005), "1兆5");
    EXPECT_THROW(formatJapaneseGrouped(-5), std::out_of_range);
}

// =============================================================================
// 英语读法
// =============================================================================

TEST(EnglishReadingTest, GroupReading) {
    EXPECT_EQ(englishGroupReading(5), "five");
    EXPECT_EQ(englishGroupReading(15), "fifteen");
    EXPECT_EQ(englishGroupReading(40), "forty");
    EXPECT_EQ(englishGroupReading(21), "twenty-one");
    EXPECT_EQ(englishGroupReading(100), "one hundred");
    EXPECT_EQ(englishGroupReading(567), "five hundred sixty-seven");
}

TEST(EnglishReadingTest, FullReading) {
    EXPECT_EQ(intToEnglishReading(0), "zero");
    EXPECT_EQ(intToEnglishReading(2560), "two thousand five hundred sixty");
    EXPECT_EQ(intToEnglishReading(1000000), "one million");
    EXPECT_EQ(intToEnglishReading(1000000000000), "one trillion");
    EXPECT_EQ(intToEnglishReading(1234567),
              "one million two hundred thirty-four thousand five hundred sixty-seven");
}

TEST(EnglishReadingTest, RejectsOutOfRange) {
    EXPECT_NO_THROW(intToEnglishReading(kMaxEnglishValue));
    EXPECT_THROW(intToEnglishReading(kMaxEnglishValue + 1), std::out_of_range);
    EXPECT_THROW(intToEnglishReading(-1), std::out_of_range);
}

TEST(EnglishGroupedTest, ThousandsSeparators) {
    EXPECT_EQ(formatWesternGrouped(0), "0");
    EXPECT_EQ(formatWesternGrouped(999), "999");
    EXPECT_EQ(formatWesternGrouped(1000), "1,000");
    EXPECT_EQ(formatWesternGrouped(1234567), "1,234,567");
}

// =============================================================================
// 溢出检查
// =============================================================================

TEST(CheckedArithmeticTest, DetectsOverflow) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t out = 0;

    EXPECT_TRUE(checkedAdd(1, 2, &out));
    EXPECT_EQ(out, 3);
    EXPECT_FALSE(checkedAdd(kMax, 1, &out));

    EXPECT_TRUE(checkedMul(0, kMax, &out));
    EXPECT_EQ(out, 0);
    EXPECT_TRUE(checkedMul(kMan, kOku, &out));
    EXPECT_EQ(out, kCho);
    EXPECT_FALSE(checkedMul(kMax / 2 + 1, 2, &out));
}

} // namespace kazu::text
