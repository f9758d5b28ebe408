#ifndef JAPANESE_NUMERAL_CODEC_HPP
#define JAPANESE_NUMERAL_CODEC_HPP

#include <cstdint>

#include <optional>
#include <string>

#include "internal/codecs/numeral_codec.hpp"

namespace kazu {

// =============================================================================
// Japanese Numeral Codec
// =============================================================================
//
// 日语数字编解码。
// 读法: 平假名, 含音便 (さんびゃく, さんぜん), 大单位间以 "、" 停顿。
// 分组: 1兆2億3万4 形式, 不使用逗号。
// 解码: 先尝试 数字+万億兆 混合写法, 再用平假名状态机。
//

class JapaneseNumeralCodec : public INumeralCodec {
public:
    JapaneseNumeralCodec();
    ~JapaneseNumeralCodec() override;

    Language getLanguage() const override;
    std::string getName() const override;
    int64_t getMaxValue() const override;
    std::string getZeroWord() const override;

    std::string encodeSpoken(int64_t value) const override;
    std::string encodeGrouped(int64_t value) const override;
    std::optional<int64_t> decode(const std::string& text) const override;
};

}  // namespace kazu

#endif  // JAPANESE_NUMERAL_CODEC_HPP
