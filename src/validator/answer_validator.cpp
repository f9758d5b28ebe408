#include "internal/validator/answer_validator.hpp"

#include <cstdint>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/text/similarity.hpp"
#include "internal/text/text_utils.hpp"

namespace kazu {

namespace {

// 浮点相似度与阈值比较时的容差 (如 1 - 1/5 与 0.80f)
constexpr float kThresholdEpsilon = 1e-6f;

}  // namespace

// =============================================================================
// 构造与析构
// =============================================================================

AnswerValidator::AnswerValidator(const ValidatorConfig& config)
    : config_(config)
    , japanese_codec_(NumeralCodecFactory::create(Language::JA))
    , english_codec_(NumeralCodecFactory::create(Language::EN)) {
    auto error = config_.validate();
    if (!error.isOk()) {
        throw std::invalid_argument("Invalid validator config: " + error.message);
    }
}

AnswerValidator::~AnswerValidator() = default;

// =============================================================================
// 主入口
// =============================================================================

ValidationResult AnswerValidator::validate(const std::string& user_answer,
                                           const std::string& correct_answer,
                                           Language language,
                                           int64_t correct_number) const {
    ValidationResult result;
    result.user_answer = user_answer;
    result.correct_answer = correct_answer;
    result.correct_number = correct_number;
    result.user_number = extractNumber(user_answer, language);
    result.user_parsed = result.user_number.has_value();

    const std::string user_norm = normalizeAnswer(user_answer);
    const std::string correct_norm = normalizeAnswer(correct_answer);

    auto accept = [&result](MatchMethod method, float confidence) {
        result.is_correct = true;
        result.method = method;
        result.confidence = confidence;
        return result;
    };
    auto meets_threshold = [this](float score) {
        return score + kThresholdEpsilon >= config_.fuzzy_threshold;
    };

    // 1. 文本完全一致
    if (user_norm == correct_norm) {
        return accept(MatchMethod::EXACT, config_.exact_confidence);
    }

    // 2. 数值一致
    if (result.user_parsed && *result.user_number == correct_number) {
        return accept(MatchMethod::NUMERIC, config_.numeric_confidence);
    }

    // 3. 模糊匹配 (发音差异、识别噪声)
    const float fuzzy_similarity = text::similarity(user_norm, correct_norm);
    if (meets_threshold(fuzzy_similarity)) {
        return accept(MatchMethod::FUZZY, fuzzy_similarity);
    }

    // 4. 日语空白变体
    if (language == Language::JA && config_.enable_variants) {
        for (const auto& variant : japaneseVariants(correct_norm)) {
            float variant_similarity = text::similarity(user_norm, variant);
            if (meets_threshold(variant_similarity)) {
                return accept(MatchMethod::VARIANT, variant_similarity);
            }
        }
    }

    result.is_correct = false;
    result.method = MatchMethod::REJECTED;
    result.confidence = fuzzy_similarity;
    return result;
}

// =============================================================================
// 数值提取
// =============================================================================

std::optional<int64_t> AnswerValidator::extractNumber(const std::string& answer,
                                                      Language language) const {
    // "2,560" / " 5402 " 直接按数字解析
    std::string compact;
    for (const auto& ch : text::splitUtf8(text::trim(text::foldFullwidthDigits(answer)))) {
        if (ch == "," || text::isWhitespace(ch)) continue;
        compact += ch;
    }
    if (text::isAllDigits(compact)) {
        return text::parseDecimal(compact);
    }

    const INumeralCodec* codec = codecFor(language);
    if (!codec) {
        return std::nullopt;
    }
    return codec->decode(answer);
}

const INumeralCodec* AnswerValidator::codecFor(Language language) const {
    switch (language) {
        case Language::JA: return japanese_codec_.get();
        case Language::EN: return english_codec_.get();
        default:           return nullptr;
    }
}

// =============================================================================
// 文本规范化
// =============================================================================

std::string AnswerValidator::normalizeAnswer(const std::string& answer) {
    std::string result;
    bool pending_space = false;

    for (const auto& ch : text::splitUtf8(text::toLowerAscii(text::foldFullwidthDigits(answer)))) {
        // 连字符按空格处理: "twenty-one" == "twenty one"
        if (text::isWhitespace(ch) || ch == "-" || ch == "－") {
            if (!result.empty()) pending_space = true;
            continue;
        }
        if (text::isPunctuation(ch)) {
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += ch;
    }

    return result;
}

std::vector<std::string> AnswerValidator::japaneseVariants(const std::string& normalized) {
    std::string collapsed;
    std::string single_spaced;
    bool pending_space = false;
    for (char c : normalized) {
        if (c == ' ') {
            if (!single_spaced.empty()) pending_space = true;
            continue;
        }
        if (pending_space) {
            single_spaced += ' ';
            pending_space = false;
        }
        single_spaced += c;
        collapsed += c;
    }

    std::vector<std::string> variants = {collapsed};
    if (single_spaced != collapsed) {
        variants.push_back(single_spaced);
    }
    return variants;
}

}  // namespace kazu
