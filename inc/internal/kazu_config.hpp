#ifndef KAZU_CONFIG_HPP
#define KAZU_CONFIG_HPP

#include <string>

#include "kazu_types.hpp"

namespace kazu {

// =============================================================================
// Validator Config (校验配置 - 内部使用)
// =============================================================================

struct ValidatorConfig {
    // -------------------------------------------------------------------------
    // 置信度
    // -------------------------------------------------------------------------

    // 默认值 1.0 / 0.95 为约定的固定置信度, 修改后 EXACT / NUMERIC 的
    // confidence 随之改变, 仅用于调用方自定义评分。
    float exact_confidence = 1.0f;      ///< EXACT 命中时的置信度
    float numeric_confidence = 0.95f;   ///< NUMERIC 命中时的置信度

    // -------------------------------------------------------------------------
    // 模糊匹配
    // -------------------------------------------------------------------------

    float fuzzy_threshold = 0.80f;      ///< 相似度阈值, >= 即判定正确
    bool enable_variants = true;        ///< 日语空白变体匹配 (VARIANT 层)

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static ValidatorConfig Default() {
        return ValidatorConfig();
    }

    /// @brief 严格模式: 只接受高相似度, 关闭变体匹配
    static ValidatorConfig Strict() {
        ValidatorConfig config;
        config.fuzzy_threshold = 0.95f;
        config.enable_variants = false;
        return config;
    }

    /// @brief 宽松模式: 适合识别噪声较大的语音输入
    static ValidatorConfig Lenient() {
        ValidatorConfig config;
        config.fuzzy_threshold = 0.70f;
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    ValidatorConfig withThreshold(float threshold) const {
        auto c = *this;
        c.fuzzy_threshold = threshold;
        return c;
    }

    ValidatorConfig withVariants(bool enabled) const {
        auto c = *this;
        c.enable_variants = enabled;
        return c;
    }

    /// @brief 覆盖 NUMERIC 置信度 (默认 0.95)
    ValidatorConfig withNumericConfidence(float confidence) const {
        auto c = *this;
        c.numeric_confidence = confidence;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (!(fuzzy_threshold >= 0.0f && fuzzy_threshold <= 1.0f)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Fuzzy threshold must be 0-1", std::to_string(fuzzy_threshold));
        }
        if (!(exact_confidence >= 0.0f && exact_confidence <= 1.0f)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Exact confidence must be 0-1");
        }
        if (!(numeric_confidence >= 0.0f && numeric_confidence <= 1.0f)) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Numeric confidence must be 0-1");
        }
        return ErrorInfo::ok();
    }
};

}  // namespace kazu

#endif  // KAZU_CONFIG_HPP
