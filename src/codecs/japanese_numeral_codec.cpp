#include "internal/codecs/japanese_numeral_codec.hpp"

#include <cstdint>

#include <optional>
#include <string>

#include "internal/text/japanese_number_parser.hpp"
#include "internal/text/number_utils.hpp"

namespace kazu {

// =============================================================================
// 构造与析构
// =============================================================================

JapaneseNumeralCodec::JapaneseNumeralCodec() = default;
JapaneseNumeralCodec::~JapaneseNumeralCodec() = default;

// =============================================================================
// 编解码器信息
// =============================================================================

Language JapaneseNumeralCodec::getLanguage() const {
    return Language::JA;
}

std::string JapaneseNumeralCodec::getName() const {
    return "japanese";
}

int64_t JapaneseNumeralCodec::getMaxValue() const {
    return text::kMaxJapaneseValue;
}

std::string JapaneseNumeralCodec::getZeroWord() const {
    return text::japaneseDigitReading(0);
}

// =============================================================================
// 编码 / 解码
// =============================================================================

std::string JapaneseNumeralCodec::encodeSpoken(int64_t value) const {
    return text::intToJapaneseReading(value);
}

std::string JapaneseNumeralCodec::encodeGrouped(int64_t value) const {
    return text::formatJapaneseGrouped(value);
}

std::optional<int64_t> JapaneseNumeralCodec::decode(const std::string& input) const {
    return text::parseJapaneseNumber(input);
}

}  // namespace kazu
