#include <cstdint>

#include <memory>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"
#include "internal/codecs/numeral_codec.hpp"

namespace kazu {

// =============================================================================
// 工厂
// =============================================================================

TEST(NumeralCodecFactoryTest, CreatesCodecPerLanguage) {
    auto japanese = NumeralCodecFactory::create(Language::JA);
    ASSERT_NE(japanese, nullptr);
    EXPECT_EQ(japanese->getLanguage(), Language::JA);
    EXPECT_EQ(japanese->getName(), "japanese");
    EXPECT_EQ(japanese->getZeroWord(), "ぜろ");
    EXPECT_EQ(japanese->getMaxValue(), 9999999999999999LL);

    auto english = NumeralCodecFactory::create(Language::EN);
    ASSERT_NE(english, nullptr);
    EXPECT_EQ(english->getLanguage(), Language::EN);
    EXPECT_EQ(english->getName(), "english");
    EXPECT_EQ(english->getZeroWord(), "zero");
    EXPECT_EQ(english->getMaxValue(), 999999999999999LL);
}

TEST(NumeralCodecFactoryTest, ReportsAvailability) {
    EXPECT_TRUE(NumeralCodecFactory::isAvailable(Language::JA));
    EXPECT_TRUE(NumeralCodecFactory::isAvailable(Language::EN));

    std::vector<Language> expected = {Language::JA, Language::EN};
    EXPECT_EQ(NumeralCodecFactory::getAvailableLanguages(), expected);

    EXPECT_STREQ(NumeralCodecFactory::getLanguageName(Language::JA), "ja");
    EXPECT_STREQ(NumeralCodecFactory::getLanguageName(Language::EN), "en");
}

TEST(NumeralCodecTest, SupportsValue) {
    auto codec = NumeralCodecFactory::create(Language::EN);
    ASSERT_NE(codec, nullptr);
    EXPECT_TRUE(codec->supportsValue(0));
    EXPECT_TRUE(codec->supportsValue(codec->getMaxValue()));
    EXPECT_FALSE(codec->supportsValue(codec->getMaxValue() + 1));
    EXPECT_FALSE(codec->supportsValue(-1));
}

// =============================================================================
// 编解码
// =============================================================================

TEST(NumeralCodecTest, EncodeThrowsOutsideDomain) {
    for (auto language : NumeralCodecFactory::getAvailableLanguages()) {
        auto codec = NumeralCodecFactory::create(language);
        ASSERT_NE(codec, nullptr);
        EXPECT_THROW(codec->encodeSpoken(-1), std::out_of_range);
        EXPECT_THROW(codec->encodeSpoken(codec->getMaxValue() + 1), std::out_of_range);
        EXPECT_THROW(codec->encodeGrouped(codec->getMaxValue() + 1), std::out_of_range);
    }
}

TEST(NumeralCodecTest, ZeroEncodesToZeroWord) {
    for (auto language : NumeralCodecFactory::getAvailableLanguages()) {
        auto codec = NumeralCodecFactory::create(language);
        ASSERT_NE(codec, nullptr);
        EXPECT_EQ(codec->encodeSpoken(0), codec->getZeroWord());
        EXPECT_EQ(codec->encodeGrouped(0), "0");
        EXPECT_EQ(codec->decode(codec->getZeroWord()), 0);
    }
}

TEST(NumeralCodecTest, GroupedForms) {
    auto japanese = NumeralCodecFactory::create(Language::JA);
    auto english = NumeralCodecFactory::create(Language::EN);
    ASSERT_NE(japanese, nullptr);
    ASSERT_NE(english, nullptr);

    EXPECT_EQ(japanese->encodeGrouped(123456789), "1億2345万6789");
    EXPECT_EQ(english->encodeGrouped(123456789), "123,456,789");
    EXPECT_EQ(japanese->decode(japanese->encodeGrouped(123456789)), 123456789);
    EXPECT_EQ(english->decode(english->encodeGrouped(123456789)), 123456789);
}

TEST(NumeralCodecTest, SpokenRoundTrip) {
    const std::vector<int64_t> samples = {
        1, 4, 7, 9, 10, 11, 19, 20, 99, 100, 101, 300, 600, 800, 999,
        1000, 1001, 3000, 8000, 2560, 9999, 10000, 12345, 100000, 3000000,
        10000000, 20000005, 100000001, 123456789, 1000000000,
        1000000000000, 987654321012345LL, 999999999999999LL,
    };

    for (auto language : NumeralCodecFactory::getAvailableLanguages()) {
        auto codec = NumeralCodecFactory::create(language);
        ASSERT_NE(codec, nullptr);
        for (int64_t value : samples) {
            EXPECT_EQ(codec->decode(codec->encodeSpoken(value)), value)
                << codec->getName() << ": " << codec->encodeSpoken(value);
        }
    }

    auto japanese = NumeralCodecFactory::create(Language::JA);
    ASSERT_NE(japanese, nullptr);
    EXPECT_EQ(japanese->decode(japanese->encodeSpoken(9999999999999999LL)), 9999999999999999LL);
}

TEST(NumeralCodecTest, SpokenRoundTripAcrossGroups) {
    for (auto language : NumeralCodecFactory::getAvailableLanguages()) {
        auto codec = NumeralCodecFactory::create(language);
        ASSERT_NE(codec, nullptr);
        // 步长与 10 的幂互质, 覆盖各位的全部数字
        for (int64_t value = 1; value < 2000000; value += 7919) {
            EXPECT_EQ(codec->decode(codec->encodeSpoken(value)), value)
                << codec->getName() << ": " << codec->encodeSpoken(value);
        }
    }
}

} // namespace kazu
