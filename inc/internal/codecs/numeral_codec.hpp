#ifndef NUMERAL_CODEC_HPP
#define NUMERAL_CODEC_HPP

#include <cstdint>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/kazu_types.hpp"

namespace kazu {

// =============================================================================
// Numeral Codec Interface (数字编解码抽象接口)
// =============================================================================
//
// 每种语言一个实现, 负责 数值 <-> 文本 的双向转换。
// 所有实现都是无状态的, 可在多线程中共享。
//
// 添加新语言的步骤:
// 1. 继承 INumeralCodec
// 2. 实现所有纯虚函数
// 3. 在 NumeralCodecFactory 中注册
//
// 已实现的语言:
// - JapaneseNumeralCodec: 日语 (平假名读法, 万/億/兆 分组)
// - EnglishNumeralCodec:  英语 (3 位分组)
//

class INumeralCodec {
public:
    virtual ~INumeralCodec() = default;

    // -------------------------------------------------------------------------
    // 编解码器信息
    // -------------------------------------------------------------------------

    /// @brief 获取语言
    virtual Language getLanguage() const = 0;

    /// @brief 获取名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 获取支持的最大数值
    virtual int64_t getMaxValue() const = 0;

    /// @brief 获取零的读法
    virtual std::string getZeroWord() const = 0;

    /// @brief 检查数值是否在支持范围内
    bool supportsValue(int64_t value) const {
        return value >= 0 && value <= getMaxValue();
    }

    // -------------------------------------------------------------------------
    // 编码
    // -------------------------------------------------------------------------

    /// @brief 数值转读法文本
    /// @param value 非负整数
    /// @return 读法文本
    /// @throws std::out_of_range 超出 getMaxValue() 或为负
    virtual std::string encodeSpoken(int64_t value) const = 0;

    /// @brief 数值转分组数字文本
    /// @param value 非负整数
    /// @return 分组文本 ("1,234" / "1万234")
    /// @throws std::out_of_range 超出 getMaxValue() 或为负
    virtual std::string encodeGrouped(int64_t value) const = 0;

    // -------------------------------------------------------------------------
    // 解码
    // -------------------------------------------------------------------------

    /// @brief 文本转数值
    /// @param text 读法、数字或混合文本
    /// @return 数值, 无法识别返回 std::nullopt
    virtual std::optional<int64_t> decode(const std::string& text) const = 0;
};

// =============================================================================
// Codec Factory (编解码器工厂)
// =============================================================================

class NumeralCodecFactory {
public:
    /// @brief 创建编解码器实例
    /// @param language 语言
    /// @return 编解码器实例, 失败返回nullptr
    static std::unique_ptr<INumeralCodec> create(Language language);

    /// @brief 检查语言是否可用
    /// @param language 语言
    /// @return 是否可用
    static bool isAvailable(Language language);

    /// @brief 获取所有可用的语言
    static std::vector<Language> getAvailableLanguages();

    /// @brief 获取语言名称
    static const char* getLanguageName(Language language) {
        return languageToString(language);
    }
};

}  // namespace kazu

#endif  // NUMERAL_CODEC_HPP
