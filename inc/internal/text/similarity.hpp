#ifndef SIMILARITY_HPP
#define SIMILARITY_HPP

/**
 * Similarity - 字符串相似度模块
 *
 * 以 UTF-8 字符 (而非字节) 为单位计算编辑距离,
 * 保证日文假名与英文字母的权重一致。
 */

#include <cstddef>

#include <string>

namespace kazu {
namespace text {

/**
 * @brief Levenshtein 编辑距离 (插入/删除/替换各计 1)
 * @param a UTF-8 字符串
 * @param b UTF-8 字符串
 * @return 字符级编辑距离
 */
size_t levenshteinDistance(const std::string& a, const std::string& b);

/**
 * @brief 归一化相似度
 * @return 1 - distance / max(len(a), len(b)); 两者都为空时返回 1.0
 */
float similarity(const std::string& a, const std::string& b);

}  // namespace text
}  // namespace kazu

#endif  // SIMILARITY_HPP
