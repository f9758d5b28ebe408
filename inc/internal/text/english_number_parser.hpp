#ifndef ENGLISH_NUMBER_PARSER_HPP
#define ENGLISH_NUMBER_PARSER_HPP

/**
 * EnglishNumberParser - 英语数字解析模块
 *
 * 将英语数字读法 (可夹杂语音识别输出的阿拉伯数字) 解析为整数,
 * 如 "two thousand five hundred sixty"、"1 billion 200 million"。
 */

#include <cstdint>

#include <optional>
#include <string>
#include <vector>

namespace kazu {
namespace text {

/**
 * @brief 按空白与连字符切分为小写 token
 * @param text 原始文本
 * @return token 列表 (不含空串)
 */
std::vector<std::string> tokenizeEnglishNumber(const std::string& text);

/**
 * @brief 将英语数字文本解析为整数
 * @param text 原始文本, 大小写不敏感
 * @return 数值; 无法识别、结果为 0 或溢出时返回 std::nullopt
 *
 * 规则:
 * - 去除 token 标点后只剩 "zero" (或全 0 数字) 时返回 0, 如 "Zero."
 * - 数字 token (允许千位逗号) 与 one..ninety 累加到 current
 * - "hundred": current = (current 或 1) * 100
 * - thousand/million/billion/trillion: result += (current 或 1) * scale, current 清零
 * - 其他 token ("and", "a" 等) 忽略
 */
std::optional<int64_t> parseEnglishNumber(const std::string& text);

}  // namespace text
}  // namespace kazu

#endif  // ENGLISH_NUMBER_PARSER_HPP
