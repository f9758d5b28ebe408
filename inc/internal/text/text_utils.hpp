#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串处理、标点符号/空白判断、大小写折叠、
 * 全角数字折叠以及十进制数字解析等功能。
 */

#include <cstdint>

#include <optional>
#include <string>
#include <vector>

namespace kazu {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 根据首字节计算 UTF-8 字符的字节长度
 * @param lead 首字节
 * @return 1-4, 非法首字节按 1 处理
 */
size_t utf8CharLength(unsigned char lead);

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 */
std::vector<std::string> splitUtf8(const std::string& str);

// =============================================================================
// 字符类型判断
// =============================================================================

/**
 * @brief 判断是否为 ASCII 数字
 * @param ch UTF-8 编码的单个字符
 * @return true 如果是 0-9
 */
bool isDigit(const std::string& ch);

/**
 * @brief 判断是否为空白字符
 * @param ch UTF-8 编码的单个字符
 * @return true 如果是 ASCII 空白或全角空格 (U+3000)
 */
bool isWhitespace(const std::string& ch);

/**
 * @brief 判断是否为标点符号 (含日文读点 "、" 与句点 "。")
 * @param s 要检查的字符串
 * @return true 如果是标点符号
 */
bool isPunctuation(const std::string& s);

// =============================================================================
// 字符串变换
// =============================================================================

/**
 * @brief ASCII 字母转小写, 其余字节原样保留
 */
std::string toLowerAscii(const std::string& str);

/**
 * @brief 去除首尾 ASCII 空白
 */
std::string trim(const std::string& str);

/**
 * @brief 全角数字 ０-９ 折叠为 ASCII 0-9
 *
 * 语音识别在日语模式下经常输出全角数字。
 */
std::string foldFullwidthDigits(const std::string& str);

// =============================================================================
// 数字解析
// =============================================================================

/**
 * @brief 判断字符串是否非空且全部由 ASCII 数字组成
 */
bool isAllDigits(const std::string& str);

/**
 * @brief 解析纯数字字符串
 * @param digits 仅含 0-9 的字符串
 * @return 数值; 为空、含非数字字符或超出 int64 范围时返回 std::nullopt
 */
std::optional<int64_t> parseDecimal(const std::string& digits);

}  // namespace text
}  // namespace kazu

#endif  // TEXT_UTILS_HPP
