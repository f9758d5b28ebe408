#ifndef ENGLISH_NUMERAL_CODEC_HPP
#define ENGLISH_NUMERAL_CODEC_HPP

#include <cstdint>

#include <optional>
#include <string>

#include "internal/codecs/numeral_codec.hpp"

namespace kazu {

// =============================================================================
// English Numeral Codec
// =============================================================================
//
// 英语数字编解码。
// 读法: "two thousand five hundred sixty", 21-99 用连字符。
// 分组: 千位逗号 "1,234,567"。
// 解码: 单词与语音识别输出的阿拉伯数字可混合。
//

class EnglishNumeralCodec : public INumeralCodec {
public:
    EnglishNumeralCodec();
    ~EnglishNumeralCodec() override;

    Language getLanguage() const override;
    std::string getName() const override;
    int64_t getMaxValue() const override;
    std::string getZeroWord() const override;

    std::string encodeSpoken(int64_t value) const override;
    std::string encodeGrouped(int64_t value) const override;
    std::optional<int64_t> decode(const std::string& text) const override;
};

}  // namespace kazu

#endif  // ENGLISH_NUMERAL_CODEC_HPP
