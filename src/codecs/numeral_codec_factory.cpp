#include "internal/codecs/numeral_codec.hpp"

#include <memory>
#include <vector>

#include "internal/codecs/english_numeral_codec.hpp"
#include "internal/codecs/japanese_numeral_codec.hpp"

namespace kazu {

// =============================================================================
// NumeralCodecFactory 实现
// =============================================================================

std::unique_ptr<INumeralCodec> NumeralCodecFactory::create(Language language) {
    switch (language) {
        case Language::JA:
            return std::make_unique<JapaneseNumeralCodec>();

        case Language::EN:
            return std::make_unique<EnglishNumeralCodec>();

        default:
            return nullptr;
    }
}

bool NumeralCodecFactory::isAvailable(Language language) {
    switch (language) {
        case Language::JA:
        case Language::EN:
            return true;

        default:
            return false;
    }
}

std::vector<Language> NumeralCodecFactory::getAvailableLanguages() {
    return {
        Language::JA,
        Language::EN
    };
}

}  // namespace kazu
