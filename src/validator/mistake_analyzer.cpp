#include "internal/validator/mistake_analyzer.hpp"

#include <cstdint>

#include <string>

namespace kazu {

MistakeAnalysis analyzeMistake(const ValidationResult& result) {
    MistakeAnalysis analysis;
    if (result.is_correct) {
        return analysis;
    }

    if (!result.user_parsed || !result.user_number) {
        analysis.kind = MistakeKind::NOT_RECOGNIZED;
        return analysis;
    }

    const int64_t user = *result.user_number;
    const int64_t correct = result.correct_number;
    const std::string user_str = std::to_string(user);
    const std::string correct_str = std::to_string(correct);

    analysis.user_digits = static_cast<int>(user_str.size());
    analysis.correct_digits = static_cast<int>(correct_str.size());
    analysis.difference = user > correct ? user - correct : correct - user;

    // diff / correct < 10%  <=>  diff < ceil(correct / 10)
    if (correct > 0 && analysis.difference < correct / 10 + (correct % 10 != 0 ? 1 : 0)) {
        analysis.kind = MistakeKind::VERY_CLOSE;
        return analysis;
    }

    if (user_str.size() < correct_str.size()) {
        analysis.kind = MistakeKind::FEWER_DIGITS;
        return analysis;
    }
    if (user_str.size() > correct_str.size()) {
        analysis.kind = MistakeKind::MORE_DIGITS;
        return analysis;
    }

    for (size_t i = 0; i < user_str.size(); ++i) {
        if (user_str[i] != correct_str[i]) {
            analysis.kind = MistakeKind::WRONG_PLACE;
            analysis.place = static_cast<int>(user_str.size() - 1 - i);
            return analysis;
        }
    }

    analysis.kind = MistakeKind::TRY_AGAIN;
    return analysis;
}

}  // namespace kazu
