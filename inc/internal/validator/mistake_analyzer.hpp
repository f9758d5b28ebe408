#ifndef MISTAKE_ANALYZER_HPP
#define MISTAKE_ANALYZER_HPP

#include "internal/kazu_types.hpp"

namespace kazu {

/**
 * @brief 分析被拒绝的回答错在哪里
 *
 * 判定顺序:
 * 1. 回答正确 -> NONE
 * 2. 没有解析出数值 -> NOT_RECOGNIZED
 * 3. 相差不足正确值的 10% -> VERY_CLOSE (difference)
 * 4. 位数不同 -> FEWER_DIGITS / MORE_DIGITS (user_digits, correct_digits)
 * 5. 位数相同 -> WRONG_PLACE, place 为最高的不同位 (0 = 个位)
 * 6. 其余 -> TRY_AGAIN
 *
 * @param result AnswerValidator::validate() 的结果
 * @return 错误分析 (不含界面文案)
 */
MistakeAnalysis analyzeMistake(const ValidationResult& result);

}  // namespace kazu

#endif  // MISTAKE_ANALYZER_HPP
