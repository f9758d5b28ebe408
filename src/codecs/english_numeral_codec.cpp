#include "internal/codecs/english_numeral_codec.hpp"

#include <cstdint>

#include <optional>
#include <string>

#include "internal/text/english_number_parser.hpp"
#include "internal/text/number_utils.hpp"

namespace kazu {

// =============================================================================
// 构造与析构
// =============================================================================

EnglishNumeralCodec::EnglishNumeralCodec() = default;
EnglishNumeralCodec::~EnglishNumeralCodec() = default;

// =============================================================================
// 编解码器信息
// =============================================================================

Language EnglishNumeralCodec::getLanguage() const {
    return Language::EN;
}

std::string EnglishNumeralCodec::getName() const {
    return "english";
}

int64_t EnglishNumeralCodec::getMaxValue() const {
    return text::kMaxEnglishValue;
}

std::string EnglishNumeralCodec::getZeroWord() const {
    return "zero";
}

// =============================================================================
// 编码 / 解码
// =============================================================================

std::string EnglishNumeralCodec::encodeSpoken(int64_t value) const {
    return text::intToEnglishReading(value);
}

std::string EnglishNumeralCodec::encodeGrouped(int64_t value) const {
    return text::formatWesternGrouped(value);
}

std::optional<int64_t> EnglishNumeralCodec::decode(const std::string& input) const {
    return text::parseEnglishNumber(input);
}

}  // namespace kazu
