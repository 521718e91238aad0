#include <gtest/gtest.h>

#include <cstdint>

#include "jamo/hangul.hpp"

using namespace jamo;

TEST(HangulClassifyTest, CompatibilityJamo) {
    EXPECT_EQ(classify(U'ㄱ'), CodepointRole::LeadConsonant);
    EXPECT_EQ(classify(U'ㅎ'), CodepointRole::LeadConsonant);
    EXPECT_EQ(classify(U'ㄸ'), CodepointRole::LeadConsonant);
    EXPECT_EQ(classify(U'ㅏ'), CodepointRole::Vowel);
    EXPECT_EQ(classify(U'ㅢ'), CodepointRole::Vowel);
    EXPECT_EQ(classify(U'ㅣ'), CodepointRole::Vowel);
}

TEST(HangulClassifyTest, ClustersOnlyCloseASyllable) {
    for (char32_t ch : {U'ㄳ', U'ㄵ', U'ㄶ', U'ㄺ', U'ㄻ', U'ㄼ', U'ㄽ', U'ㄾ', U'ㄿ', U'ㅀ', U'ㅄ'}) {
        EXPECT_EQ(classify(ch), CodepointRole::TailConsonant)
            << "U+" << std::hex << static_cast<uint32_t>(ch);
    }
}

TEST(HangulClassifyTest, ConjoiningJamo) {
    EXPECT_EQ(classify(0x1100), CodepointRole::LeadConsonant);
    EXPECT_EQ(classify(0x1112), CodepointRole::LeadConsonant);
    EXPECT_EQ(classify(0x1161), CodepointRole::Vowel);
    EXPECT_EQ(classify(0x1175), CodepointRole::Vowel);
    EXPECT_EQ(classify(0x11A8), CodepointRole::TailConsonant);
    EXPECT_EQ(classify(0x11C2), CodepointRole::TailConsonant);
    // Archaic letters outside the modern ranges
    EXPECT_EQ(classify(0x1113), CodepointRole::NonHangul);
    EXPECT_EQ(classify(0x11C3), CodepointRole::NonHangul);
}

TEST(HangulClassifyTest, SyllablesAndOtherText) {
    EXPECT_EQ(classify(U'가'), CodepointRole::ComposedSyllable);
    EXPECT_EQ(classify(U'힣'), CodepointRole::ComposedSyllable);
    EXPECT_EQ(classify(0xD7A4), CodepointRole::NonHangul);
    EXPECT_EQ(classify(U'a'), CodepointRole::NonHangul);
    EXPECT_EQ(classify(U'-'), CodepointRole::NonHangul);
    EXPECT_EQ(classify(U'漢'), CodepointRole::NonHangul);
    EXPECT_EQ(classify(U'\0'), CodepointRole::NonHangul);
    EXPECT_EQ(classify(0x3164), CodepointRole::NonHangul) << "Hangul filler is not a letter";
    EXPECT_EQ(classify(0x3171), CodepointRole::NonHangul) << "archaic compatibility letter";
}

TEST(HangulClassifyTest, ConsonantPredicate) {
    EXPECT_TRUE(is_consonant(U'ㄴ'));
    EXPECT_TRUE(is_consonant(U'ㄺ'));
    EXPECT_TRUE(is_consonant(0x11AB));
    EXPECT_FALSE(is_consonant(U'ㅏ'));
    EXPECT_FALSE(is_consonant(U'가'));
    EXPECT_FALSE(is_consonant(U'n'));
    EXPECT_TRUE(is_hangul(U'ㅏ'));
    EXPECT_FALSE(is_hangul(U'n'));
}

TEST(HangulDecomposeTest, KnownSyllables) {
    auto han = decompose(U'한');
    ASSERT_TRUE(han.has_value());
    EXPECT_EQ(han->lead, 18);
    EXPECT_EQ(han->vowel, 0);
    EXPECT_EQ(han->tail, 4);

    auto ga = decompose(U'가');
    ASSERT_TRUE(ga.has_value());
    EXPECT_EQ(ga->lead, 0);
    EXPECT_EQ(ga->vowel, 0);
    EXPECT_EQ(ga->tail, 0);

    auto a = decompose(U'아');
    ASSERT_TRUE(a.has_value());
    EXPECT_TRUE(is_null_onset(a->lead));
}

TEST(HangulDecomposeTest, RejectsNonSyllables) {
    EXPECT_FALSE(decompose(U'ㅇ').has_value());
    EXPECT_FALSE(decompose(U'a').has_value());
    EXPECT_FALSE(decompose(0xABFF).has_value());
    EXPECT_FALSE(decompose(0xD7A4).has_value());
}

TEST(HangulDecomposeTest, ComposeInvertsDecomposeOverFullRange) {
    int count = 0;
    for (int lead = 0; lead < kLeadCount; ++lead) {
        for (int vowel = 0; vowel < kVowelCount; ++vowel) {
            for (int tail = 0; tail < kTailCount; ++tail) {
                auto syllable = compose_syllable(SyllableIndices{lead, vowel, tail});
                ASSERT_TRUE(syllable.has_value());
                ASSERT_EQ(classify(*syllable), CodepointRole::ComposedSyllable);
                auto parts = decompose(*syllable);
                ASSERT_TRUE(parts.has_value());
                ASSERT_EQ(parts->lead, lead);
                ASSERT_EQ(parts->vowel, vowel);
                ASSERT_EQ(parts->tail, tail);
                ++count;
            }
        }
    }
    EXPECT_EQ(count, 11172);
    EXPECT_EQ(compose_syllable(SyllableIndices{0, 0, 0}), std::optional<char32_t>(kSyllableBase));
    EXPECT_EQ(compose_syllable(SyllableIndices{18, 20, 27}),
              std::optional<char32_t>(kSyllableLast));
}

TEST(HangulDecomposeTest, ComposeRejectsOutOfRangeIndices) {
    EXPECT_FALSE(compose_syllable(SyllableIndices{19, 0, 0}).has_value());
    EXPECT_FALSE(compose_syllable(SyllableIndices{0, 21, 0}).has_value());
    EXPECT_FALSE(compose_syllable(SyllableIndices{0, 0, 28}).has_value());
    EXPECT_FALSE(compose_syllable(SyllableIndices{-1, 0, 0}).has_value());
}

TEST(HangulIndexTest, CompatibilityAndConjoiningAgree) {
    EXPECT_EQ(lead_index(U'ㅎ'), std::optional<int>(18));
    EXPECT_EQ(lead_index(0x1112), std::optional<int>(18));
    EXPECT_EQ(vowel_index(U'ㅡ'), std::optional<int>(kFillerVowelIndex));
    EXPECT_EQ(vowel_index(0x1173), std::optional<int>(kFillerVowelIndex));
    EXPECT_EQ(tail_index(U'ㄴ'), std::optional<int>(4));
    EXPECT_EQ(tail_index(0x11AB), std::optional<int>(4));
    EXPECT_EQ(lead_index(U'ㅇ'), std::optional<int>(kNullOnsetIndex));
}

TEST(HangulIndexTest, SlotMismatches) {
    EXPECT_FALSE(lead_index(U'ㄳ').has_value());
    EXPECT_FALSE(tail_index(U'ㄸ').has_value());
    EXPECT_FALSE(tail_index(U'ㅃ').has_value());
    EXPECT_FALSE(tail_index(U'ㅉ').has_value());
    EXPECT_FALSE(vowel_index(U'ㄱ').has_value());
    EXPECT_FALSE(tail_index(U'\0').has_value());
}

TEST(HangulIndexTest, ReverseLookups) {
    EXPECT_EQ(lead_jamo(kNullOnsetIndex), std::optional<char32_t>(kNullOnset));
    EXPECT_EQ(vowel_jamo(kFillerVowelIndex), std::optional<char32_t>(kFillerVowel));
    EXPECT_EQ(tail_jamo(4), std::optional<char32_t>(U'ㄴ'));
    EXPECT_FALSE(tail_jamo(0).has_value());
    EXPECT_FALSE(lead_jamo(19).has_value());
    EXPECT_FALSE(vowel_jamo(-1).has_value());

    for (int idx = 0; idx < kLeadCount; ++idx) {
        EXPECT_EQ(lead_index(*lead_jamo(idx)), std::optional<int>(idx));
    }
    for (int idx = 1; idx < kTailCount; ++idx) {
        EXPECT_EQ(tail_index(*tail_jamo(idx)), std::optional<int>(idx));
    }
}
