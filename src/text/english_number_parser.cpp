#include "internal/text/english_number_parser.hpp"

#include <cstdint>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/text/number_utils.hpp"
#include "internal/text/text_utils.hpp"

namespace kazu {
namespace text {

namespace {

// =============================================================================
// 英文数字词表
// =============================================================================

// ones / teens / tens 均直接累加到 current
const std::unordered_map<std::string, int64_t> ENGLISH_ADDITIVE_WORDS = {
    {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
    {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9},
    {"ten", 10}, {"eleven", 11}, {"twelve", 12}, {"thirteen", 13}, {"fourteen", 14},
    {"fifteen", 15}, {"sixteen", 16}, {"seventeen", 17}, {"eighteen", 18}, {"nineteen", 19},
    {"twenty", 20}, {"thirty", 30}, {"forty", 40}, {"fifty", 50},
    {"sixty", 60}, {"seventy", 70}, {"eighty", 80}, {"ninety", 90},
};

const std::unordered_map<std::string, int64_t> ENGLISH_SCALE_WORDS = {
    {"thousand", kThousand},
    {"million", kMillion},
    {"billion", kBillion},
    {"trillion", kTrillion},
};

// "1,000" -> "1000", "sixty." -> "sixty"
std::string stripTokenPunctuation(const std::string& token) {
    std::string cleaned;
    for (char c : token) {
        if (c == ',' || c == '.' || c == '!' || c == '?' || c == ';' || c == ':' ||
            c == '"' || c == '\'') {
            continue;
        }
        cleaned += c;
    }
    return cleaned;
}

}  // namespace

std::vector<std::string> tokenizeEnglishNumber(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : toLowerAscii(text)) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '-') {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::optional<int64_t> parseEnglishNumber(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& token : tokenizeEnglishNumber(text)) {
        std::string word = stripTokenPunctuation(token);
        if (!word.empty()) {
            words.push_back(word);
        }
    }

    // 显式零: "zero", "Zero.", "000"
    if (words.size() == 1 && words[0] == "zero") return 0;
    if (!words.empty()) {
        bool all_zero = true;
        for (const auto& word : words) {
            if (!isAllDigits(word) || word.find_first_not_of('0') != std::string::npos) {
                all_zero = false;
                break;
            }
        }
        if (all_zero) return 0;
    }

    int64_t result = 0;
    int64_t current = 0;

    for (const auto& word : words) {
        // 语音识别可能直接输出 "100" 之类的数字
        if (isAllDigits(word)) {
            auto value = parseDecimal(word);
            if (!value || !checkedAdd(current, *value, &current)) return std::nullopt;
            continue;
        }

        auto add_it = ENGLISH_ADDITIVE_WORDS.find(word);
        if (add_it != ENGLISH_ADDITIVE_WORDS.end()) {
            if (!checkedAdd(current, add_it->second, &current)) return std::nullopt;
            continue;
        }

        if (word == "hundred") {
            if (!checkedMul(current == 0 ? 1 : current, 100, &current)) return std::nullopt;
            continue;
        }

        auto scale_it = ENGLISH_SCALE_WORDS.find(word);
        if (scale_it != ENGLISH_SCALE_WORDS.end()) {
            int64_t term = 0;
            if (!checkedMul(current == 0 ? 1 : current, scale_it->second, &term)) return std::nullopt;
            if (!checkedAdd(result, term, &result)) return std::nullopt;
            current = 0;
        }
    }

    if (!checkedAdd(result, current, &result)) return std::nullopt;

    if (result > 0) {
        return result;
    }
    return std::nullopt;
}

}  // namespace text
}  // namespace kazu
