#ifndef JAPANESE_NUMBER_PARSER_HPP
#define JAPANESE_NUMBER_PARSER_HPP

/**
 * JapaneseNumberParser - 日语数字解析模块
 *
 * 将日语数字文本解析为整数。支持两种输入:
 * 1. 数字与 万/億/兆 混合写法, 如 "300万"、"1億2345万6789"
 * 2. 纯平假名读法, 如 "さんびゃくまん"、"にせんごひゃくろくじゅう"
 */

#include <cstdint>

#include <optional>
#include <string>

namespace kazu {
namespace text {

// =============================================================================
// 平假名状态机
// =============================================================================

/**
 * @brief 平假名解析状态
 *
 * - final_result:  已完成的 万/億/兆 组之和
 * - group_value:   当前 万 以下组内累计值
 * - pending_digit: 已读到但尚未被单位消费的数字
 */
struct HiraganaParseState {
    int64_t final_result = 0;
    int64_t group_value = 0;
    int64_t pending_digit = 0;
};

/**
 * @brief 解析纯平假名数字
 * @param text 已去除分隔符的文本
 * @return 数值; 结果为 0 或溢出时返回 std::nullopt
 *
 * 每个位置按优先级尝试: 大单位 (ちょう/おく/まん) -> 小单位
 * (せん/ひゃく/じゅう 含音便写法) -> 数字读法 (长读法优先)。
 * 无法匹配的字符直接跳过。
 */
std::optional<int64_t> parseHiraganaNumber(const std::string& text);

// =============================================================================
// 数字/汉字混合
// =============================================================================

/**
 * @brief 判断文本是否为混合写法 (含 ASCII 数字或 万/億/兆)
 */
bool isMixedJapaneseNumber(const std::string& text);

/**
 * @brief 解析数字与 万/億/兆 混合写法
 * @param text 已去除分隔符的文本
 * @return 数值; 不是混合写法、结果为 0 或溢出时返回 std::nullopt
 *
 * 单位前没有数字时系数按 1 处理 (如 "兆" -> 1000000000000)。
 * 单位前的汉字数字不作为系数: "三百万" 按 "万" 读作 10000。
 */
std::optional<int64_t> parseMixedJapaneseNumber(const std::string& text);

// =============================================================================
// 入口
// =============================================================================

/**
 * @brief 去除日语数字文本中的空白与分隔符, 并折叠全角数字
 * @param text 原始文本
 * @return 清理后的文本
 */
std::string stripJapaneseSeparators(const std::string& text);

/**
 * @brief 将日语数字文本解析为整数
 * @param text 原始文本 (可含 "、"、空格、全角数字)
 * @return 数值; 无法识别时返回 std::nullopt
 *
 * 只有明确表示零的输入 ("ぜろ"、"れい"、"零"、全 0 数字) 返回 0。
 */
std::optional<int64_t> parseJapaneseNumber(const std::string& text);

}  // namespace text
}  // namespace kazu

#endif  // JAPANESE_NUMBER_PARSER_HPP
