#ifndef NUMBER_UTILS_HPP
#define NUMBER_UTILS_HPP

/**
 * NumberUtils - 数字处理工具模块
 *
 * 提供整数转日语读法 (平假名)、整数转英语读法、
 * 分组数字格式 (1億2345万6789 / 1,234,567) 以及音便规则。
 */

#include <cstdint>

#include <string>
#include <vector>

namespace kazu {
namespace text {

// =============================================================================
// 数值范围与单位
// =============================================================================

constexpr int64_t kMan = 10000LL;                  // 万 10^4
constexpr int64_t kOku = 100000000LL;              // 億 10^8
constexpr int64_t kCho = 1000000000000LL;          // 兆 10^12

constexpr int64_t kThousand = 1000LL;
constexpr int64_t kMillion = 1000000LL;
constexpr int64_t kBillion = 1000000000LL;
constexpr int64_t kTrillion = 1000000000000LL;

constexpr int64_t kMaxJapaneseValue = 9999999999999999LL;  // 9999兆9999億9999万9999
constexpr int64_t kMaxEnglishValue = 999999999999999LL;    // 999 trillion ... 999

/// 日语大单位之间的停顿符
constexpr const char* kJapanesePause = "、";

// =============================================================================
// 溢出检查
// =============================================================================

/**
 * @brief 带溢出检查的加法
 * @return false 表示溢出, 此时 out 不变
 */
bool checkedAdd(int64_t a, int64_t b, int64_t* out);

/**
 * @brief 带溢出检查的乘法 (仅用于非负数)
 * @return false 表示溢出, 此时 out 不变
 */
bool checkedMul(int64_t a, int64_t b, int64_t* out);

// =============================================================================
// 日语数字转换
// =============================================================================

/**
 * @brief 单个数字的平假名读法
 * @param digit 0-9
 * @return 如 3 -> "さん", 0 -> "ぜろ"
 */
std::string japaneseDigitReading(int digit);

/**
 * @brief 应用音便规则
 * @param unit 单位的基本读法 ("ひゃく", "せん", ...)
 * @param digit 前置数字 1-9
 * @return 音便后的单位读法, 无规则时原样返回
 *
 * 规则表:
 * - ひゃく: 3 -> びゃく, 6 -> ぴゃく, 8 -> ぴゃく
 * - せん:   3 -> ぜん
 */
std::string applyJapaneseEuphony(const std::string& unit, int digit);

/**
 * @brief 单位的全部写法 (基本读法 + 所有音便读法)
 * @param unit 单位的基本读法
 * @return 如 "ひゃく" -> {"ひゃく", "びゃく", "ぴゃく"}
 */
std::vector<std::string> japaneseUnitSpellings(const std::string& unit);

/**
 * @brief 将 1-9999 转换为日语读法 (不含 万/億/兆)
 * @param num 1-9999
 * @return 如 2560 -> "にせんごひゃくろくじゅう"
 */
std::string japaneseGroupReading(int num);

/**
 * @brief 将整数转换为日语读法 (平假名)
 * @param num 0 到 kMaxJapaneseValue
 * @return 如 12345 -> "いちまん、にせんさんびゃくよんじゅうご"
 * @throws std::out_of_range 如果 num 为负或超过 kMaxJapaneseValue
 *
 * 特殊处理:
 * - 0 -> "ぜろ"
 * - 1 在 せん/ひゃく/じゅう 前省略 (100 -> "ひゃく")
 * - 万/億/兆 各组之间用 "、" 分隔
 */
std::string intToJapaneseReading(int64_t num);

/**
 * @brief 日语分组数字格式
 * @param num 0 到 kMaxJapaneseValue
 * @return 如 123456789 -> "1億2345万6789", 0 -> "0"
 * @throws std::out_of_range 如果超出范围
 */
std::string formatJapaneseGrouped(int64_t num);

// =============================================================================
// 英语数字转换
// =============================================================================

/**
 * @brief 将 1-999 转换为英语读法
 * @param num 1-999
 * @return 如 123 -> "one hundred twenty-three"
 */
std::string englishGroupReading(int num);

/**
 * @brief 将整数转换为英语读法
 * @param num 0 到 kMaxEnglishValue
 * @return 如 2560 -> "two thousand five hundred sixty"
 * @throws std::out_of_range 如果 num 为负或超过 kMaxEnglishValue
 */
std::string intToEnglishReading(int64_t num);

/**
 * @brief 西式千位分隔格式
 * @param num 0 到 kMaxEnglishValue
 * @return 如 1234567 -> "1,234,567"
 * @throws std::out_of_range 如果超出范围
 */
std::string formatWesternGrouped(int64_t num);

}  // namespace text
}  // namespace kazu

#endif  // NUMBER_UTILS_HPP
