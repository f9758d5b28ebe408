#ifndef ANSWER_VALIDATOR_HPP
#define ANSWER_VALIDATOR_HPP

/**
 * AnswerValidator - 回答校验模块
 *
 * 按固定优先级逐层比较学习者的回答与标准答案:
 *
 *   EXACT -> NUMERIC -> FUZZY -> VARIANT (仅日语) -> REJECTED
 *
 * 前一层命中即返回, 后续层不再计算。任何一层失败都不是错误。
 */

#include <cstdint>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/codecs/numeral_codec.hpp"
#include "internal/kazu_config.hpp"
#include "internal/kazu_types.hpp"

namespace kazu {

class AnswerValidator {
public:
    explicit AnswerValidator(const ValidatorConfig& config = ValidatorConfig());
    ~AnswerValidator();

    AnswerValidator(const AnswerValidator&) = delete;
    AnswerValidator& operator=(const AnswerValidator&) = delete;

    /**
     * @brief 校验回答
     * @param user_answer 用户原始回答 (语音识别结果)
     * @param correct_answer 标准答案文本
     * @param language 回答语言
     * @param correct_number 标准答案数值
     * @return 校验结果 (始终包含解析出的用户数值)
     *
     * REJECTED 时 confidence 为 FUZZY 层的相似度, 不取变体的相似度。
     * 最后一个变体即规范化后的标准答案, 两者数值相同。
     */
    ValidationResult validate(const std::string& user_answer,
                              const std::string& correct_answer,
                              Language language,
                              int64_t correct_number) const;

    /**
     * @brief 从回答中提取数值
     * @param answer 用户原始回答
     * @param language 回答语言
     * @return 数值; 去掉逗号和空白后是纯数字时直接解析, 否则交给对应语言的解码器
     */
    std::optional<int64_t> extractNumber(const std::string& answer, Language language) const;

    /// @brief 获取当前配置
    const ValidatorConfig& getConfig() const { return config_; }

    // -------------------------------------------------------------------------
    // 文本规范化
    // -------------------------------------------------------------------------

    /**
     * @brief 规范化回答文本
     *
     * ASCII 转小写、全角数字折叠、去除标点和 "、"、
     * 连字符视为空格、连续空白合并为一个空格并去除首尾空白。
     */
    static std::string normalizeAnswer(const std::string& answer);

    /**
     * @brief 生成日语空白变体 (去除全部空白 / 单空格), 保序去重
     * @param normalized 已规范化的标准答案
     */
    static std::vector<std::string> japaneseVariants(const std::string& normalized);

private:
    const INumeralCodec* codecFor(Language language) const;

    ValidatorConfig config_;
    std::unique_ptr<INumeralCodec> japanese_codec_;
    std::unique_ptr<INumeralCodec> english_codec_;
};

}  // namespace kazu

#endif  // ANSWER_VALIDATOR_HPP
