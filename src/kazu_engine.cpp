#include "kazu_api.hpp"

#include <cstdint>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/codecs/numeral_codec.hpp"
#include "internal/kazu_config.hpp"
#include "internal/kazu_types.hpp"
#include "internal/validator/answer_validator.hpp"
#include "internal/validator/mistake_analyzer.hpp"

namespace Kazu {

// =============================================================================
// 类型转换
// =============================================================================

// 转换 Kazu::Language 到 kazu::Language
static kazu::Language convertLanguage(Language language) {
    switch (language) {
        case Language::JA:
            return kazu::Language::JA;
        case Language::EN:
            return kazu::Language::EN;
        default:
            return kazu::Language::JA;
    }
}

static Language convertLanguage(kazu::Language language) {
    switch (language) {
        case kazu::Language::EN:
            return Language::EN;
        case kazu::Language::JA:
        default:
            return Language::JA;
    }
}

static kazu::MatchMethod convertMatchMethod(MatchMethod method) {
    switch (method) {
        case MatchMethod::EXACT:    return kazu::MatchMethod::EXACT;
        case MatchMethod::NUMERIC:  return kazu::MatchMethod::NUMERIC;
        case MatchMethod::FUZZY:    return kazu::MatchMethod::FUZZY;
        case MatchMethod::VARIANT:  return kazu::MatchMethod::VARIANT;
        default:                    return kazu::MatchMethod::REJECTED;
    }
}

static MatchMethod convertMatchMethod(kazu::MatchMethod method) {
    switch (method) {
        case kazu::MatchMethod::EXACT:    return MatchMethod::EXACT;
        case kazu::MatchMethod::NUMERIC:  return MatchMethod::NUMERIC;
        case kazu::MatchMethod::FUZZY:    return MatchMethod::FUZZY;
        case kazu::MatchMethod::VARIANT:  return MatchMethod::VARIANT;
        default:                          return MatchMethod::REJECTED;
    }
}

static kazu::MistakeKind convertMistakeKind(MistakeKind kind) {
    switch (kind) {
        case MistakeKind::NONE:           return kazu::MistakeKind::NONE;
        case MistakeKind::NOT_RECOGNIZED: return kazu::MistakeKind::NOT_RECOGNIZED;
        case MistakeKind::VERY_CLOSE:     return kazu::MistakeKind::VERY_CLOSE;
        case MistakeKind::FEWER_DIGITS:   return kazu::MistakeKind::FEWER_DIGITS;
        case MistakeKind::MORE_DIGITS:    return kazu::MistakeKind::MORE_DIGITS;
        case MistakeKind::WRONG_PLACE:    return kazu::MistakeKind::WRONG_PLACE;
        default:                          return kazu::MistakeKind::TRY_AGAIN;
    }
}

static MistakeKind convertMistakeKind(kazu::MistakeKind kind) {
    switch (kind) {
        case kazu::MistakeKind::NONE:           return MistakeKind::NONE;
        case kazu::MistakeKind::NOT_RECOGNIZED: return MistakeKind::NOT_RECOGNIZED;
        case kazu::MistakeKind::VERY_CLOSE:     return MistakeKind::VERY_CLOSE;
        case kazu::MistakeKind::FEWER_DIGITS:   return MistakeKind::FEWER_DIGITS;
        case kazu::MistakeKind::MORE_DIGITS:    return MistakeKind::MORE_DIGITS;
        case kazu::MistakeKind::WRONG_PLACE:    return MistakeKind::WRONG_PLACE;
        default:                                return MistakeKind::TRY_AGAIN;
    }
}

static kazu::ValidatorConfig convertConfig(const EngineConfig& config) {
    kazu::ValidatorConfig internal_config;
    internal_config.fuzzy_threshold = config.fuzzy_threshold;
    internal_config.exact_confidence = config.exact_confidence;
    internal_config.numeric_confidence = config.numeric_confidence;
    internal_config.enable_variants = config.enable_variants;
    return internal_config;
}

static ValidationResult convertResult(const kazu::ValidationResult& internal) {
    ValidationResult result;
    result.is_correct = internal.is_correct;
    result.confidence = internal.confidence;
    result.method = convertMatchMethod(internal.method);
    result.user_answer = internal.user_answer;
    result.user_number = internal.user_number;
    result.user_parsed = internal.user_parsed;
    result.correct_answer = internal.correct_answer;
    result.correct_number = internal.correct_number;
    return result;
}

static kazu::ValidationResult convertResult(const ValidationResult& result) {
    kazu::ValidationResult internal;
    internal.is_correct = result.is_correct;
    internal.confidence = result.confidence;
    internal.method = convertMatchMethod(result.method);
    internal.user_answer = result.user_answer;
    internal.user_number = result.user_number;
    internal.user_parsed = result.user_parsed;
    internal.correct_answer = result.correct_answer;
    internal.correct_number = result.correct_number;
    return internal;
}

const char* languageName(Language language) {
    return kazu::languageToString(convertLanguage(language));
}

const char* matchMethodName(MatchMethod method) {
    return kazu::matchMethodToString(convertMatchMethod(method));
}

const char* mistakeKindName(MistakeKind kind) {
    return kazu::mistakeKindToString(convertMistakeKind(kind));
}

// =============================================================================
// NumeralEngine 实现
// =============================================================================

struct NumeralEngine::Impl {
    std::unique_ptr<kazu::INumeralCodec> japanese_codec;
    std::unique_ptr<kazu::INumeralCodec> english_codec;
    std::unique_ptr<kazu::AnswerValidator> validator;
    EngineConfig config;
    bool config_valid = false;

    void init(const EngineConfig& cfg) {
        japanese_codec = kazu::NumeralCodecFactory::create(kazu::Language::JA);
        english_codec = kazu::NumeralCodecFactory::create(kazu::Language::EN);

        auto error = convertConfig(cfg).validate();
        if (!error.isOk()) {
            std::cerr << "[kazu] Invalid engine config: " << error.message;
            if (!error.detail.empty()) {
                std::cerr << " (" << error.detail << ")";
            }
            std::cerr << ", using defaults" << std::endl;
            config = EngineConfig::Default();
            config.verbose = cfg.verbose;
            config_valid = false;
        } else {
            config = cfg;
            config_valid = true;
        }

        validator = std::make_unique<kazu::AnswerValidator>(convertConfig(config));
    }

    const kazu::INumeralCodec& codec(Language language) const {
        return language == Language::EN ? *english_codec : *japanese_codec;
    }
};

NumeralEngine::NumeralEngine(const EngineConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config);
}

NumeralEngine::~NumeralEngine() = default;

std::string NumeralEngine::EncodeSpoken(int64_t value, Language language) const {
    return impl_->codec(language).encodeSpoken(value);
}

std::string NumeralEngine::EncodeGrouped(int64_t value, Language language) const {
    return impl_->codec(language).encodeGrouped(value);
}

std::optional<int64_t> NumeralEngine::Decode(const std::string& text, Language language) const {
    return impl_->codec(language).decode(text);
}

ValidationResult NumeralEngine::Validate(const std::string& user_answer,
                                         const std::string& correct_answer,
                                         Language language,
                                         int64_t correct_number) const {
    auto internal = impl_->validator->validate(
        user_answer, correct_answer, convertLanguage(language), correct_number);

    if (impl_->config.verbose) {
        std::cerr << "[kazu] validate(" << languageName(language) << ") \""
                  << user_answer << "\" vs \"" << correct_answer << "\" -> "
                  << kazu::matchMethodToString(internal.method)
                  << " confidence=" << internal.confidence;
        if (internal.user_number) {
            std::cerr << " parsed=" << *internal.user_number;
        } else {
            std::cerr << " parsed=none";
        }
        std::cerr << std::endl;
    }

    return convertResult(internal);
}

ValidationResult NumeralEngine::ValidateNumber(const std::string& user_answer,
                                               Language language,
                                               int64_t correct_number) const {
    return Validate(user_answer, EncodeSpoken(correct_number, language), language, correct_number);
}

MistakeAnalysis NumeralEngine::ExplainMistake(const ValidationResult& result) const {
    auto internal = kazu::analyzeMistake(convertResult(result));

    MistakeAnalysis analysis;
    analysis.kind = convertMistakeKind(internal.kind);
    analysis.user_digits = internal.user_digits;
    analysis.correct_digits = internal.correct_digits;
    analysis.place = internal.place;
    analysis.difference = internal.difference;
    return analysis;
}

bool NumeralEngine::SetThreshold(float threshold) {
    auto updated = impl_->config.withThreshold(threshold);
    auto error = convertConfig(updated).validate();
    if (!error.isOk()) {
        std::cerr << "[kazu] Ignoring threshold " << threshold << ": " << error.message << std::endl;
        return false;
    }

    impl_->config = updated;
    impl_->validator = std::make_unique<kazu::AnswerValidator>(convertConfig(updated));
    return true;
}

void NumeralEngine::SetVerbose(bool verbose) {
    impl_->config.verbose = verbose;
}

EngineConfig NumeralEngine::GetConfig() const {
    return impl_->config;
}

bool NumeralEngine::IsConfigValid() const {
    return impl_->config_valid;
}

int64_t NumeralEngine::GetMaxValue(Language language) const {
    return impl_->codec(language).getMaxValue();
}

std::vector<Language> NumeralEngine::GetSupportedLanguages() const {
    std::vector<Language> languages;
    for (auto language : kazu::NumeralCodecFactory::getAvailableLanguages()) {
        languages.push_back(convertLanguage(language));
    }
    return languages;
}

// =============================================================================
// 便捷函数
// =============================================================================

static const NumeralEngine& defaultEngine() {
    static const NumeralEngine engine;
    return engine;
}

std::string encodeSpoken(int64_t value, Language language) {
    return defaultEngine().EncodeSpoken(value, language);
}

std::string encodeGrouped(int64_t value, Language language) {
    return defaultEngine().EncodeGrouped(value, language);
}

std::optional<int64_t> decode(const std::string& text, Language language) {
    return defaultEngine().Decode(text, language);
}

ValidationResult validate(const std::string& user_answer,
                          const std::string& correct_answer,
                          Language language,
                          int64_t correct_number) {
    return defaultEngine().Validate(user_answer, correct_answer, language, correct_number);
}

MistakeAnalysis explainMistake(const ValidationResult& result) {
    return defaultEngine().ExplainMistake(result);
}

}  // namespace Kazu
