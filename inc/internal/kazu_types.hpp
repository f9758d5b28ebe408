#ifndef KAZU_TYPES_HPP
#define KAZU_TYPES_HPP

#include <cstdint>

#include <optional>
#include <string>

namespace kazu {

// =============================================================================
// Language (语言)
// =============================================================================

enum class Language {
    JA,         // 日语 (4 位分组: 万 / 億 / 兆)
    EN,         // 英语 (3 位分组: thousand / million / ...)
};

inline const char* languageToString(Language lang) {
    switch (lang) {
        case Language::JA: return "ja";
        case Language::EN: return "en";
        default:           return "unknown";
    }
}

// =============================================================================
// Match Method (匹配方式)
// =============================================================================
//
// 顺序即优先级: 前一级失败才尝试下一级。
//

enum class MatchMethod {
    EXACT,          // 规范化后文本完全相同
    NUMERIC,        // 解析出的数值相同
    FUZZY,          // 编辑距离相似度达到阈值
    VARIANT,        // 日语空白变体达到阈值
    REJECTED,       // 全部失败
};

inline const char* matchMethodToString(MatchMethod method) {
    switch (method) {
        case MatchMethod::EXACT:    return "exact";
        case MatchMethod::NUMERIC:  return "numeric";
        case MatchMethod::FUZZY:    return "fuzzy";
        case MatchMethod::VARIANT:  return "variant";
        case MatchMethod::REJECTED: return "rejected";
        default:                    return "unknown";
    }
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    UNSUPPORTED_LANGUAGE = 101,

    // 输入错误 (2xx)
    VALUE_OUT_OF_RANGE = 200,
    UNPARSEABLE_TEXT = 201,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                   return "OK";
        case ErrorCode::INVALID_CONFIG:       return "INVALID_CONFIG";
        case ErrorCode::UNSUPPORTED_LANGUAGE: return "UNSUPPORTED_LANGUAGE";
        case ErrorCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";
        case ErrorCode::UNPARSEABLE_TEXT:     return "UNPARSEABLE_TEXT";
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
        default:                              return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Validation Result (校验结果)
// =============================================================================

struct ValidationResult {
    bool is_correct = false;                // 是否判定正确
    float confidence = 0.0f;                // 置信度 [0, 1]
    MatchMethod method = MatchMethod::REJECTED;  // 命中的匹配层级

    std::string user_answer;                // 用户原始回答 (未规范化)
    std::optional<int64_t> user_number;     // 从回答中解析出的数值
    bool user_parsed = false;               // 是否解析成功

    std::string correct_answer;             // 标准答案文本
    int64_t correct_number = 0;             // 标准答案数值
};

// =============================================================================
// Mistake Analysis (错误分析)
// =============================================================================

enum class MistakeKind {
    NONE,               // 回答正确
    NOT_RECOGNIZED,     // 无法解析出数字
    VERY_CLOSE,         // 相差不足 10%
    FEWER_DIGITS,       // 位数偏少
    MORE_DIGITS,        // 位数偏多
    WRONG_PLACE,        // 位数相同, 某一位不同
    TRY_AGAIN,          // 数字一致但文本未通过
};

inline const char* mistakeKindToString(MistakeKind kind) {
    switch (kind) {
        case MistakeKind::NONE:           return "none";
        case MistakeKind::NOT_RECOGNIZED: return "not_recognized";
        case MistakeKind::VERY_CLOSE:     return "very_close";
        case MistakeKind::FEWER_DIGITS:   return "fewer_digits";
        case MistakeKind::MORE_DIGITS:    return "more_digits";
        case MistakeKind::WRONG_PLACE:    return "wrong_place";
        case MistakeKind::TRY_AGAIN:      return "try_again";
        default:                          return "unknown";
    }
}

struct MistakeAnalysis {
    MistakeKind kind = MistakeKind::NONE;
    int user_digits = 0;        // 用户数字位数
    int correct_digits = 0;     // 正确数字位数
    int place = -1;             // 出错的位 (0 = 个位), -1 表示不适用
    int64_t difference = 0;     // |用户数值 - 正确数值|
};

}  // namespace kazu

#endif  // KAZU_TYPES_HPP
