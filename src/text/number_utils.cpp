#include "internal/text/number_utils.hpp"

#include <cstdint>

#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kazu {
namespace text {

namespace {

// =============================================================================
// 词表
// =============================================================================

const char* JAPANESE_DIGITS[] = {
    "ぜろ", "いち", "に", "さん", "よん",
    "ご", "ろく", "なな", "はち", "きゅう"
};

const char* JAPANESE_TEN = "じゅう";
const char* JAPANESE_HUNDRED = "ひゃく";
const char* JAPANESE_THOUSAND = "せん";

struct MajorUnit {
    int64_t value;
    const char* reading;
    const char* symbol;
};

// 从大到小
const MajorUnit JAPANESE_MAJOR_UNITS[] = {
    {kCho, "ちょう", "兆"},
    {kOku, "おく", "億"},
    {kMan, "まん", "万"},
};

// (单位, 前置数字) -> 音便读法
const std::map<std::pair<std::string, int>, std::string> JAPANESE_EUPHONY = {
    {{"ひゃく", 3}, "びゃく"},
    {{"ひゃく", 6}, "ぴゃく"},
    {{"ひゃく", 8}, "ぴゃく"},
    {{"せん", 3}, "ぜん"},
};

const char* ENGLISH_ONES[] = {
    "", "one", "two", "three", "four", "five",
    "six", "seven", "eight", "nine"
};

const char* ENGLISH_TEENS[] = {
    "ten", "eleven", "twelve", "thirteen", "fourteen",
    "fifteen", "sixteen", "seventeen", "eighteen", "nineteen"
};

const char* ENGLISH_TENS[] = {
    "", "", "twenty", "thirty", "forty", "fifty",
    "sixty", "seventy", "eighty", "ninety"
};

const char* ENGLISH_GROUPS[] = {
    "", "thousand", "million", "billion", "trillion"
};

void checkRange(int64_t num, int64_t max_value, const char* what) {
    if (num < 0 || num > max_value) {
        throw std::out_of_range(std::string(what) + ": value " + std::to_string(num) +
            " outside [0, " + std::to_string(max_value) + "]");
    }
}

// 千/百 位: 系数 1 省略数字, 其余 数字 + 音便单位
std::string japanesePlace(int coefficient, const char* unit) {
    if (coefficient == 1) {
        return applyJapaneseEuphony(unit, 1);
    }
    return std::string(JAPANESE_DIGITS[coefficient]) + applyJapaneseEuphony(unit, coefficient);
}

}  // namespace

// =============================================================================
// 溢出检查
// =============================================================================

bool checkedAdd(int64_t a, int64_t b, int64_t* out) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) return false;
    *out = a + b;
    return true;
}

bool checkedMul(int64_t a, int64_t b, int64_t* out) {
    if (a != 0 && b > std::numeric_limits<int64_t>::max() / a) return false;
    *out = a * b;
    return true;
}

// =============================================================================
// 日语数字转换
// =============================================================================

std::string japaneseDigitReading(int digit) {
    if (digit < 0 || digit > 9) {
        throw std::out_of_range("japaneseDigitReading: digit " + std::to_string(digit));
    }
    return JAPANESE_DIGITS[digit];
}

std::string applyJapaneseEuphony(const std::string& unit, int digit) {
    auto it = JAPANESE_EUPHONY.find({unit, digit});
    if (it != JAPANESE_EUPHONY.end()) {
        return it->second;
    }
    return unit;
}

std::vector<std::string> japaneseUnitSpellings(const std::string& unit) {
    std::vector<std::string> spellings = {unit};
    for (const auto& [key, variant] : JAPANESE_EUPHONY) {
        if (key.first != unit) continue;
        bool seen = false;
        for (const auto& s : spellings) {
            if (s == variant) {
                seen = true;
                break;
            }
        }
        if (!seen) spellings.push_back(variant);
    }
    return spellings;
}

std::string japaneseGroupReading(int num) {
    std::string result;

    int thousands = num / 1000;
    if (thousands > 0) {
        result += japanesePlace(thousands, JAPANESE_THOUSAND);
    }
    num %= 1000;

    int hundreds = num / 100;
    if (hundreds > 0) {
        result += japanesePlace(hundreds, JAPANESE_HUNDRED);
    }
    num %= 100;

    // じゅう 没有音便, 1 同样省略
    int tens = num / 10;
    if (tens > 0) {
        if (tens != 1) {
            result += JAPANESE_DIGITS[tens];
        }
        result += JAPANESE_TEN;
    }
    num %= 10;

    if (num > 0) {
        result += JAPANESE_DIGITS[num];
    }

    return result;
}

std::string intToJapaneseReading(int64_t num) {
    checkRange(num, kMaxJapaneseValue, "intToJapaneseReading");
    if (num == 0) return JAPANESE_DIGITS[0];

    std::vector<std::string> parts;
    for (const auto& unit : JAPANESE_MAJOR_UNITS) {
        int64_t coefficient = num / unit.value;
        if (coefficient > 0) {
            parts.push_back(japaneseGroupReading(static_cast<int>(coefficient)) + unit.reading);
        }
        num %= unit.value;
    }
    if (num > 0) {
        parts.push_back(japaneseGroupReading(static_cast<int>(num)));
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += kJapanesePause;
        result += parts[i];
    }
    return result;
}

std::string formatJapaneseGrouped(int64_t num) {
    checkRange(num, kMaxJapaneseValue, "formatJapaneseGrouped");

    std::string result;
    for (const auto& unit : JAPANESE_MAJOR_UNITS) {
        int64_t coefficient = num / unit.value;
        if (coefficient > 0) {
            result += std::to_string(coefficient) + unit.symbol;
        }
        num %= unit.value;
    }
    if (num > 0 || result.empty()) {
        result += std::to_string(num);
    }
    return result;
}

// =============================================================================
// 英语数字转换
// =============================================================================

std::string englishGroupReading(int num) {
    std::string result;

    int hundreds = num / 100;
    if (hundreds > 0) {
        result += std::string(ENGLISH_ONES[hundreds]) + " hundred";
    }
    num %= 100;

    std::string rest;
    if (num >= 20) {
        rest = ENGLISH_TENS[num / 10];
        if (num % 10 != 0) {
            rest += "-" + std::string(ENGLISH_ONES[num % 10]);
        }
    } else if (num >= 10) {
        rest = ENGLISH_TEENS[num - 10];
    } else if (num > 0) {
        rest = ENGLISH_ONES[num];
    }

    if (!rest.empty()) {
        if (!result.empty()) result += " ";
        result += rest;
    }
    return result;
}

std::string intToEnglishReading(int64_t num) {
    checkRange(num, kMaxEnglishValue, "intToEnglishReading");
    if (num == 0) return "zero";

    std::string result;
    int group_index = 0;
    while (num > 0) {
        int group = static_cast<int>(num % 1000);
        if (group > 0) {
            std::string group_text = englishGroupReading(group);
            if (group_index > 0) {
                group_text += " " + std::string(ENGLISH_GROUPS[group_index]);
            }
            result = result.empty() ? group_text : group_text + " " + result;
        }
        num /= 1000;
        group_index++;
    }
    return result;
}

std::string formatWesternGrouped(int64_t num) {
    checkRange(num, kMaxEnglishValue, "formatWesternGrouped");

    std::string digits = std::to_string(num);
    std::string result;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), *it);
        count++;
    }
    return result;
}

}  // namespace text
}  // namespace kazu
