#include "internal/text/text_utils.hpp"

#include <cstdint>

#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace kazu {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

size_t utf8CharLength(unsigned char lead) {
    if ((lead & 0x80) == 0) {
        return 1;  // ASCII
    } else if ((lead & 0xE0) == 0xC0) {
        return 2;  // 2-byte UTF-8
    } else if ((lead & 0xF0) == 0xE0) {
        return 3;  // 3-byte UTF-8
    } else if ((lead & 0xF8) == 0xF0) {
        return 4;  // 4-byte UTF-8
    }
    return 1;
}

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        size_t char_len = utf8CharLength(static_cast<unsigned char>(str[i]));
        if (i + char_len <= str.length()) {
            result.push_back(str.substr(i, char_len));
        }
        i += char_len;
    }
    return result;
}

// =============================================================================
// 字符类型判断
// =============================================================================

bool isDigit(const std::string& ch) {
    if (ch.length() != 1) return false;
    char c = ch[0];
    return c >= '0' && c <= '9';
}

bool isWhitespace(const std::string& ch) {
    if (ch.length() == 1) {
        char c = ch[0];
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }
    return ch == "　";  // 全角空格
}

bool isPunctuation(const std::string& s) {
    static const std::unordered_set<std::string> puncts = {
        ",", ".", "!", "?", ":", ";", "\"", "'", "-", "_",
        "(", ")", "[", "]", "{", "}", "~",
        "，", "。", "！", "？", "：", "；", "、", "・",
        "「", "」", "『", "』", "（", "）", "【", "】",
        "…", "—", "–", "－", "〜", "～",
        "“", "”", "‘", "’",
    };
    return puncts.count(s) > 0;
}

// =============================================================================
// 字符串变换
// =============================================================================

std::string toLowerAscii(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

std::string trim(const std::string& str) {
    static const char* kWhitespace = " \t\n\r\f\v";
    size_t begin = str.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) return "";
    size_t end = str.find_last_not_of(kWhitespace);
    return str.substr(begin, end - begin + 1);
}

std::string foldFullwidthDigits(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        // U+FF10..U+FF19 = EF BC 90..EF BC 99
        if (i + 2 < str.size() &&
            static_cast<unsigned char>(str[i]) == 0xEF &&
            static_cast<unsigned char>(str[i + 1]) == 0xBC) {
            unsigned char c2 = static_cast<unsigned char>(str[i + 2]);
            if (c2 >= 0x90 && c2 <= 0x99) {
                result += static_cast<char>('0' + (c2 - 0x90));
                i += 2;
                continue;
            }
        }
        result += str[i];
    }
    return result;
}

// =============================================================================
// 数字解析
// =============================================================================

bool isAllDigits(const std::string& str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::optional<int64_t> parseDecimal(const std::string& digits) {
    if (!isAllDigits(digits)) return std::nullopt;

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t value = 0;
    for (char c : digits) {
        int d = c - '0';
        if (value > (kMax - d) / 10) {
            return std::nullopt;
        }
        value = value * 10 + d;
    }
    return value;
}

}  // namespace text
}  // namespace kazu
