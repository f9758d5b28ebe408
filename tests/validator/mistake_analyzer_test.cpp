#include <cstdint>

#include <optional>

#include "gtest/gtest.h"
#include "internal/validator/mistake_analyzer.hpp"

namespace kazu {

namespace {

ValidationResult rejected(std::optional<int64_t> user_number, int64_t correct_number) {
    ValidationResult result;
    result.is_correct = false;
    result.method = MatchMethod::REJECTED;
    result.user_number = user_number;
    result.user_parsed = user_number.has_value();
    result.correct_number = correct_number;
    return result;
}

}  // namespace

TEST(MistakeAnalyzerTest, CorrectAnswerHasNoMistake) {
    ValidationResult result;
    result.is_correct = true;
    result.method = MatchMethod::NUMERIC;
    result.user_number = 2560;
    result.user_parsed = true;
    result.correct_number = 2560;

    auto analysis = analyzeMistake(result);
    EXPECT_EQ(analysis.kind, MistakeKind::NONE);
    EXPECT_EQ(analysis.place, -1);
}

TEST(MistakeAnalyzerTest, NotRecognized) {
    auto analysis = analyzeMistake(rejected(std::nullopt, 2560));
    EXPECT_EQ(analysis.kind, MistakeKind::NOT_RECOGNIZED);
}

TEST(MistakeAnalyzerTest, VeryClose) {
    auto analysis = analyzeMistake(rejected(2500, 2560));
    EXPECT_EQ(analysis.kind, MistakeKind::VERY_CLOSE);
    EXPECT_EQ(analysis.difference, 60);

    // 255 / 2560 < 10%, 256 / 2560 == 10%
    EXPECT_EQ(analyzeMistake(rejected(2305, 2560)).kind, MistakeKind::VERY_CLOSE);
    EXPECT_NE(analyzeMistake(rejected(2304, 2560)).kind, MistakeKind::VERY_CLOSE);
}

TEST(MistakeAnalyzerTest, DigitCount) {
    auto fewer = analyzeMistake(rejected(250, 2560));
    EXPECT_EQ(fewer.kind, MistakeKind::FEWER_DIGITS);
    EXPECT_EQ(fewer.user_digits, 3);
    EXPECT_EQ(fewer.correct_digits, 4);

    auto more = analyzeMistake(rejected(25600, 2560));
    EXPECT_EQ(more.kind, MistakeKind::MORE_DIGITS);
    EXPECT_EQ(more.user_digits, 5);
    EXPECT_EQ(more.correct_digits, 4);
}

TEST(MistakeAnalyzerTest, WrongPlaceIsMostSignificantDifference) {
    auto thousands = analyzeMistake(rejected(3560, 2560));
    EXPECT_EQ(thousands.kind, MistakeKind::WRONG_PLACE);
    EXPECT_EQ(thousands.place, 3);

    auto hundreds = analyzeMistake(rejected(2960, 2560));
    EXPECT_EQ(hundreds.kind, MistakeKind::WRONG_PLACE);
    EXPECT_EQ(hundreds.place, 2);

    EXPECT_EQ(analyzeMistake(rejected(2304, 2560)).place, 2);
}

TEST(MistakeAnalyzerTest, ZeroCorrectNumberIsNeverClose) {
    auto analysis = analyzeMistake(rejected(5, 0));
    EXPECT_EQ(analysis.kind, MistakeKind::WRONG_PLACE);
    EXPECT_EQ(analysis.place, 0);
}

TEST(MistakeAnalyzerTest, SameNumberRejectedByText) {
    auto analysis = analyzeMistake(rejected(0, 0));
    EXPECT_EQ(analysis.kind, MistakeKind::TRY_AGAIN);
}

} // namespace kazu
