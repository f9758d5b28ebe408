#ifndef KAZU_API_HPP
#define KAZU_API_HPP

/**
 * Kazu - 日英双语数字读法核心库
 *
 * 提供数字读法的编码、解码, 以及听写/口述练习中的回答校验。
 *
 * 使用示例 1 - 编码与解码:
 *
 *   auto spoken = Kazu::encodeSpoken(12345, Kazu::Language::JA);
 *   // "いちまん、にせんさんびゃくよんじゅうご"
 *   auto value = Kazu::decode("3億5000万", Kazu::Language::JA);
 *   // 350000000
 *
 * 使用示例 2 - 校验回答:
 *
 *   auto result = Kazu::validate("2,560", "two thousand five hundred sixty",
 *                                Kazu::Language::EN, 2560);
 *   if (result.is_correct) {
 *       // result.method == Kazu::MatchMethod::NUMERIC
 *   }
 *
 * 使用示例 3 - 带配置的引擎:
 *
 *   Kazu::EngineConfig config = Kazu::EngineConfig::Lenient().withVerbose(true);
 *   Kazu::NumeralEngine engine(config);
 *   auto result = engine.Validate("さんびゃく", "さんびゃく", Kazu::Language::JA, 300);
 *   auto mistake = engine.ExplainMistake(result);
 */

#include <cstdint>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Kazu {

// =============================================================================
// Language - 语言
// =============================================================================

enum class Language {
    JA,     ///< 日语 (万 / 億 / 兆 四位分组)
    EN,     ///< 英语 (三位分组)
};

// =============================================================================
// MatchMethod - 匹配方式
// =============================================================================

enum class MatchMethod {
    EXACT,      ///< 规范化文本一致
    NUMERIC,    ///< 数值一致
    FUZZY,      ///< 相似度达到阈值
    VARIANT,    ///< 日语空白变体达到阈值
    REJECTED,   ///< 不正确
};

// =============================================================================
// MistakeKind - 错误类型
// =============================================================================

enum class MistakeKind {
    NONE,
    NOT_RECOGNIZED,
    VERY_CLOSE,
    FEWER_DIGITS,
    MORE_DIGITS,
    WRONG_PLACE,
    TRY_AGAIN,
};

/// @brief 语言代码 ("ja" / "en")
const char* languageName(Language language);

/// @brief 匹配方式名称 ("exact", "numeric", ...)
const char* matchMethodName(MatchMethod method);

/// @brief 错误类型名称 ("very_close", "wrong_place", ...)
const char* mistakeKindName(MistakeKind kind);

// =============================================================================
// ValidationResult - 校验结果
// =============================================================================

struct ValidationResult {
    bool is_correct = false;                    ///< 是否判定正确
    float confidence = 0.0f;                    ///< 置信度 [0, 1]
    MatchMethod method = MatchMethod::REJECTED; ///< 命中的匹配层级

    std::string user_answer;                    ///< 用户原始回答
    std::optional<int64_t> user_number;         ///< 从回答中解析出的数值
    bool user_parsed = false;                   ///< 是否解析成功

    std::string correct_answer;                 ///< 标准答案文本
    int64_t correct_number = 0;                 ///< 标准答案数值
};

// =============================================================================
// MistakeAnalysis - 错误分析
// =============================================================================

struct MistakeAnalysis {
    MistakeKind kind = MistakeKind::NONE;
    int user_digits = 0;        ///< 用户数字位数
    int correct_digits = 0;     ///< 正确数字位数
    int place = -1;             ///< 出错的位 (0 = 个位), -1 表示不适用
    int64_t difference = 0;     ///< |用户数值 - 正确数值|
};

// =============================================================================
// EngineConfig - 引擎配置
// =============================================================================

struct EngineConfig {
    // -------------------------------------------------------------------------
    // 校验参数
    // -------------------------------------------------------------------------

    float fuzzy_threshold = 0.80f;      ///< 模糊匹配阈值 [0, 1]
    // 默认 1.0 / 0.95, 改动后 EXACT / NUMERIC 结果的置信度随之改变
    float exact_confidence = 1.0f;      ///< EXACT 置信度
    float numeric_confidence = 0.95f;   ///< NUMERIC 置信度
    bool enable_variants = true;        ///< 日语空白变体匹配

    // -------------------------------------------------------------------------
    // 调试
    // -------------------------------------------------------------------------

    bool verbose = false;               ///< 输出每次校验的匹配过程到 stderr

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static EngineConfig Default() {
        return EngineConfig();
    }

    /// @brief 严格模式 (阈值 0.95, 关闭变体)
    static EngineConfig Strict() {
        EngineConfig config;
        config.fuzzy_threshold = 0.95f;
        config.enable_variants = false;
        return config;
    }

    /// @brief 宽松模式 (阈值 0.70)
    static EngineConfig Lenient() {
        EngineConfig config;
        config.fuzzy_threshold = 0.70f;
        return config;
    }

    // 链式配置
    EngineConfig withThreshold(float threshold) const {
        auto c = *this;
        c.fuzzy_threshold = threshold;
        return c;
    }

    EngineConfig withVariants(bool enabled) const {
        auto c = *this;
        c.enable_variants = enabled;
        return c;
    }

    EngineConfig withVerbose(bool enabled) const {
        auto c = *this;
        c.verbose = enabled;
        return c;
    }
};

// =============================================================================
// NumeralEngine - 数字读法引擎
// =============================================================================

class NumeralEngine {
public:
    // =========================================================================
    // 构造函数
    // =========================================================================

    /// @brief 构造引擎
    /// @param config 配置对象, 无效时记录错误并回退到默认配置
    explicit NumeralEngine(const EngineConfig& config = EngineConfig());

    ~NumeralEngine();

    // 禁止拷贝
    NumeralEngine(const NumeralEngine&) = delete;
    NumeralEngine& operator=(const NumeralEngine&) = delete;

    // =========================================================================
    // 编码
    // =========================================================================

    /// @brief 数值转读法
    /// @param value 非负整数, 不超过 GetMaxValue(language)
    /// @param language 语言
    /// @return 读法文本 ("にせんごひゃくろくじゅう" / "two thousand five hundred sixty")
    /// @throws std::out_of_range 数值超出范围
    std::string EncodeSpoken(int64_t value, Language language) const;

    /// @brief 数值转分组数字
    /// @param value 非负整数, 不超过 GetMaxValue(language)
    /// @param language 语言
    /// @return 分组文本 ("1億2345万6789" / "123,456,789")
    /// @throws std::out_of_range 数值超出范围
    std::string EncodeGrouped(int64_t value, Language language) const;

    // =========================================================================
    // 解码
    // =========================================================================

    /// @brief 读法、数字或混合文本转数值
    /// @param text 输入文本 (语音识别结果)
    /// @param language 语言
    /// @return 数值, 无法识别返回 std::nullopt
    std::optional<int64_t> Decode(const std::string& text, Language language) const;

    // =========================================================================
    // 校验
    // =========================================================================

    /// @brief 校验回答
    /// @param user_answer 用户原始回答
    /// @param correct_answer 标准答案文本
    /// @param language 回答语言
    /// @param correct_number 标准答案数值
    /// @return 校验结果
    ValidationResult Validate(const std::string& user_answer,
                              const std::string& correct_answer,
                              Language language,
                              int64_t correct_number) const;

    /// @brief 校验回答, 标准答案文本取 EncodeSpoken(correct_number)
    /// @throws std::out_of_range correct_number 超出范围
    ValidationResult ValidateNumber(const std::string& user_answer,
                                    Language language,
                                    int64_t correct_number) const;

    /// @brief 分析错误原因
    MistakeAnalysis ExplainMistake(const ValidationResult& result) const;

    // =========================================================================
    // 动态配置
    // =========================================================================

    /// @brief 设置模糊匹配阈值
    /// @param threshold 阈值 [0, 1]
    /// @return 是否生效 (超出范围时保持原值)
    bool SetThreshold(float threshold);

    /// @brief 开关匹配过程输出
    void SetVerbose(bool verbose);

    /// @brief 获取当前配置
    EngineConfig GetConfig() const;

    // =========================================================================
    // 辅助方法
    // =========================================================================

    /// @brief 构造时传入的配置是否有效
    bool IsConfigValid() const;

    /// @brief 获取语言支持的最大数值
    int64_t GetMaxValue(Language language) const;

    /// @brief 获取支持的语言
    std::vector<Language> GetSupportedLanguages() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// 便捷函数 (使用默认配置)
// =============================================================================

std::string encodeSpoken(int64_t value, Language language);

std::string encodeGrouped(int64_t value, Language language);

std::optional<int64_t> decode(const std::string& text, Language language);

ValidationResult validate(const std::string& user_answer,
                          const std::string& correct_answer,
                          Language language,
                          int64_t correct_number);

MistakeAnalysis explainMistake(const ValidationResult& result);

}  // namespace Kazu

#endif  // KAZU_API_HPP
