#pragma once

#include <optional>

namespace jamo {

enum class CodepointRole {
    LeadConsonant,
    Vowel,
    TailConsonant,
    ComposedSyllable,
    NonHangul,
};

// Choseong, jungseong and jongseong indices of a composed syllable. A tail
// index of 0 means the syllable has no final consonant.
struct SyllableIndices {
    int lead = 0;
    int vowel = 0;
    int tail = 0;
};

constexpr char32_t kSyllableBase = 0xAC00;
constexpr char32_t kSyllableLast = 0xD7A3;
constexpr int kLeadCount = 19;
constexpr int kVowelCount = 21;
constexpr int kTailCount = 28;

constexpr int kNullOnsetIndex = 11;
constexpr int kFillerVowelIndex = 18;
constexpr char32_t kNullOnset = U'ㅇ';
constexpr char32_t kFillerVowel = U'ㅡ';

CodepointRole classify(char32_t ch);

bool is_hangul(char32_t ch);
bool is_consonant(char32_t ch);

std::optional<SyllableIndices> decompose(char32_t ch);
std::optional<char32_t> compose_syllable(const SyllableIndices& parts);

bool is_null_onset(int lead_index);

// Accept both compatibility Jamo (U+3131..) and conjoining Jamo (U+1100..).
std::optional<int> lead_index(char32_t jamo);
std::optional<int> vowel_index(char32_t jamo);
std::optional<int> tail_index(char32_t jamo);

// Return compatibility Jamo. tail_jamo(0) is empty.
std::optional<char32_t> lead_jamo(int index);
std::optional<char32_t> vowel_jamo(int index);
std::optional<char32_t> tail_jamo(int index);

}  // namespace jamo
