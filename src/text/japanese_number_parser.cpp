#include "internal/text/japanese_number_parser.hpp"

#include <cstdint>
#include <cstring>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/number_utils.hpp"
#include "internal/text/text_utils.hpp"

namespace kazu {
namespace text {

namespace {

// =============================================================================
// 词表
// =============================================================================

struct UnitReading {
    std::string reading;
    int64_t value;
};

struct UnitSymbol {
    const char* symbol;
    int64_t value;
};

// 从大到小, 顺序即匹配顺序
const UnitSymbol MIXED_UNITS[] = {
    {"兆", kCho},
    {"億", kOku},
    {"万", kMan},
};

const std::vector<UnitReading>& majorUnitReadings() {
    static const std::vector<UnitReading> units = {
        {"ちょう", kCho},
        {"おく", kOku},
        {"まん", kMan},
    };
    return units;
}

// 小单位包含全部音便写法 (ぜん, びゃく, ぴゃく)
const std::vector<UnitReading>& minorUnitReadings() {
    static const std::vector<UnitReading> units = [] {
        std::vector<UnitReading> result;
        const std::pair<const char*, int64_t> bases[] = {
            {"せん", 1000}, {"ひゃく", 100}, {"じゅう", 10},
        };
        for (const auto& [base, value] : bases) {
            for (const auto& spelling : japaneseUnitSpellings(base)) {
                result.push_back({spelling, value});
            }
        }
        return result;
    }();
    return units;
}

// 长读法优先, 避免 "し" 抢先匹配 "しち"
const std::vector<UnitReading>& digitReadings() {
    static const std::vector<UnitReading> digits = [] {
        std::vector<UnitReading> result;
        for (int d = 0; d <= 9; ++d) {
            result.push_back({japaneseDigitReading(d), d});
        }
        // 特殊读法
        result.push_back({"し", 4});
        result.push_back({"しち", 7});
        result.push_back({"く", 9});
        // 促音形 (いっせん, ろっぴゃく, はっぴゃく)
        result.push_back({"いっ", 1});
        result.push_back({"ろっ", 6});
        result.push_back({"はっ", 8});

        std::stable_sort(result.begin(), result.end(),
            [](const UnitReading& a, const UnitReading& b) {
                return a.reading.size() > b.reading.size();
            });
        return result;
    }();
    return digits;
}

bool matchAt(const std::string& text, size_t pos, const std::string& token) {
    return text.compare(pos, token.size(), token) == 0;
}

bool isExplicitZero(const std::string& text) {
    if (text == "ぜろ" || text == "れい" || text == "零") return true;
    return isAllDigits(text) &&
        text.find_first_not_of('0') == std::string::npos;
}

// -----------------------------------------------------------------------------
// 状态转移 (返回 false 表示溢出)
// -----------------------------------------------------------------------------

bool onMajorUnit(HiraganaParseState& state, int64_t unit) {
    int64_t group = 0;
    if (!checkedAdd(state.group_value, state.pending_digit, &group)) return false;
    int64_t term = 0;
    if (!checkedMul(group == 0 ? 1 : group, unit, &term)) return false;
    if (!checkedAdd(state.final_result, term, &state.final_result)) return false;
    state.group_value = 0;
    state.pending_digit = 0;
    return true;
}

bool onMinorUnit(HiraganaParseState& state, int64_t unit) {
    int64_t term = 0;
    if (!checkedMul(state.pending_digit == 0 ? 1 : state.pending_digit, unit, &term)) return false;
    if (!checkedAdd(state.group_value, term, &state.group_value)) return false;
    state.pending_digit = 0;
    return true;
}

bool onDigit(HiraganaParseState& state, int64_t digit) {
    if (!checkedAdd(state.group_value, state.pending_digit, &state.group_value)) return false;
    state.pending_digit = digit;
    return true;
}

bool onEnd(HiraganaParseState& state) {
    if (!checkedAdd(state.group_value, state.pending_digit, &state.group_value)) return false;
    state.pending_digit = 0;
    if (!checkedAdd(state.final_result, state.group_value, &state.final_result)) return false;
    state.group_value = 0;
    return true;
}

}  // namespace

// =============================================================================
// 平假名状态机
// =============================================================================

std::optional<int64_t> parseHiraganaNumber(const std::string& text) {
    HiraganaParseState state;

    size_t i = 0;
    while (i < text.size()) {
        bool matched = false;

        // 1. 大单位: 结束当前组
        for (const auto& unit : majorUnitReadings()) {
            if (matchAt(text, i, unit.reading)) {
                if (!onMajorUnit(state, unit.value)) return std::nullopt;
                i += unit.reading.size();
                matched = true;
                break;
            }
        }

        // 2. 小单位: 乘以待定数字
        if (!matched) {
            for (const auto& unit : minorUnitReadings()) {
                if (matchAt(text, i, unit.reading)) {
                    if (!onMinorUnit(state, unit.value)) return std::nullopt;
                    i += unit.reading.size();
                    matched = true;
                    break;
                }
            }
        }

        // 3. 数字读法
        if (!matched) {
            for (const auto& digit : digitReadings()) {
                if (matchAt(text, i, digit.reading)) {
                    if (!onDigit(state, digit.value)) return std::nullopt;
                    i += digit.reading.size();
                    matched = true;
                    break;
                }
            }
        }

        // 无法识别的字符直接跳过
        if (!matched) {
            i += utf8CharLength(static_cast<unsigned char>(text[i]));
        }
    }

    if (!onEnd(state)) return std::nullopt;

    if (state.final_result > 0) {
        return state.final_result;
    }
    return std::nullopt;
}

// =============================================================================
// 数字/汉字混合
// =============================================================================

bool isMixedJapaneseNumber(const std::string& text) {
    if (text.find_first_of("0123456789") != std::string::npos) return true;
    for (const auto& unit : MIXED_UNITS) {
        if (text.find(unit.symbol) != std::string::npos) return true;
    }
    return false;
}

std::optional<int64_t> parseMixedJapaneseNumber(const std::string& text) {
    if (!isMixedJapaneseNumber(text)) return std::nullopt;

    int64_t result = 0;
    std::string remaining = text;

    for (const auto& unit : MIXED_UNITS) {
        size_t pos = remaining.find(unit.symbol);
        if (pos == std::string::npos) continue;

        size_t start = pos;
        while (start > 0 && remaining[start - 1] >= '0' && remaining[start - 1] <= '9') {
            --start;
        }

        // 单位前没有数字: 系数为 1
        int64_t coefficient = 1;
        if (start < pos) {
            auto parsed = parseDecimal(remaining.substr(start, pos - start));
            if (!parsed) return std::nullopt;
            coefficient = *parsed;
        }

        int64_t term = 0;
        if (!checkedMul(coefficient, unit.value, &term)) return std::nullopt;
        if (!checkedAdd(result, term, &result)) return std::nullopt;

        remaining.erase(start, pos - start + std::strlen(unit.symbol));
    }

    // 剩余数字 (万 以下)
    size_t begin = remaining.find_first_of("0123456789");
    if (begin != std::string::npos) {
        size_t end = remaining.find_first_not_of("0123456789", begin);
        if (end == std::string::npos) end = remaining.size();
        auto parsed = parseDecimal(remaining.substr(begin, end - begin));
        if (!parsed) return std::nullopt;
        if (!checkedAdd(result, *parsed, &result)) return std::nullopt;
    }

    if (result > 0) {
        return result;
    }
    return std::nullopt;
}

// =============================================================================
// 入口
// =============================================================================

std::string stripJapaneseSeparators(const std::string& text) {
    std::string result;
    for (const auto& ch : splitUtf8(foldFullwidthDigits(text))) {
        if (isWhitespace(ch) || isPunctuation(ch)) continue;
        result += ch;
    }
    return result;
}

std::optional<int64_t> parseJapaneseNumber(const std::string& text) {
    std::string cleaned = stripJapaneseSeparators(text);
    if (cleaned.empty()) return std::nullopt;

    if (isExplicitZero(cleaned)) {
        return 0;
    }

    auto mixed = parseMixedJapaneseNumber(cleaned);
    if (mixed) {
        return mixed;
    }

    return parseHiraganaNumber(cleaned);
}

}  // namespace text
}  // namespace kazu
