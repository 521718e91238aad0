#include "jamo/hangul.hpp"

#include <iterator>
#include <unordered_map>

namespace jamo {
namespace {

const char32_t CHO_LIST[] = {U'ㄱ', U'ㄲ', U'ㄴ', U'ㄷ', U'ㄸ', U'ㄹ', U'ㅁ', U'ㅂ', U'ㅃ', U'ㅅ',
                             U'ㅆ', U'ㅇ', U'ㅈ', U'ㅉ', U'ㅊ', U'ㅋ', U'ㅌ', U'ㅍ', U'ㅎ'};

const char32_t JUNG_LIST[] = {U'ㅏ', U'ㅐ', U'ㅑ', U'ㅒ', U'ㅓ', U'ㅔ', U'ㅕ', U'ㅖ', U'ㅗ', U'ㅘ',
                              U'ㅙ', U'ㅚ', U'ㅛ', U'ㅜ', U'ㅝ', U'ㅞ', U'ㅟ', U'ㅠ', U'ㅡ', U'ㅢ',
                              U'ㅣ'};

const char32_t JONG_LIST[] = {U'\0', U'ㄱ', U'ㄲ', U'ㄳ', U'ㄴ', U'ㄵ', U'ㄶ', U'ㄷ', U'ㄹ', U'ㄺ',
                              U'ㄻ', U'ㄼ', U'ㄽ', U'ㄾ', U'ㄿ', U'ㅀ', U'ㅁ', U'ㅂ', U'ㅄ', U'ㅅ',
                              U'ㅆ', U'ㅇ', U'ㅈ', U'ㅊ', U'ㅋ', U'ㅌ', U'ㅍ', U'ㅎ'};

// Modern ranges of the conjoining Hangul Jamo block.
constexpr char32_t kConjoiningLeadFirst = 0x1100;
constexpr char32_t kConjoiningLeadLast = 0x1112;
constexpr char32_t kConjoiningVowelFirst = 0x1161;
constexpr char32_t kConjoiningVowelLast = 0x1175;
constexpr char32_t kConjoiningTailBase = 0x11A7;
constexpr char32_t kConjoiningTailLast = 0x11C2;

const std::unordered_map<char32_t, int> CHOSEONG_INDEX = [] {
    std::unordered_map<char32_t, int> table;
    for (size_t idx = 0; idx < std::size(CHO_LIST); ++idx) {
        table.emplace(CHO_LIST[idx], static_cast<int>(idx));
    }
    return table;
}();

const std::unordered_map<char32_t, int> JUNGSEONG_INDEX = [] {
    std::unordered_map<char32_t, int> table;
    for (size_t idx = 0; idx < std::size(JUNG_LIST); ++idx) {
        table.emplace(JUNG_LIST[idx], static_cast<int>(idx));
    }
    return table;
}();

const std::unordered_map<char32_t, int> JONGSEONG_INDEX = [] {
    std::unordered_map<char32_t, int> table;
    for (size_t idx = 1; idx < std::size(JONG_LIST); ++idx) {
        table.emplace(JONG_LIST[idx], static_cast<int>(idx));
    }
    return table;
}();

bool in_range(char32_t ch, char32_t first, char32_t last) { return ch >= first && ch <= last; }

}  // namespace

CodepointRole classify(char32_t ch) {
    if (CHOSEONG_INDEX.count(ch) > 0) {
        return CodepointRole::LeadConsonant;
    }
    if (JUNGSEONG_INDEX.count(ch) > 0) {
        return CodepointRole::Vowel;
    }
    // Clusters such as ㄳ or ㄺ only ever close a syllable.
    if (JONGSEONG_INDEX.count(ch) > 0) {
        return CodepointRole::TailConsonant;
    }
    if (in_range(ch, kConjoiningLeadFirst, kConjoiningLeadLast)) {
        return CodepointRole::LeadConsonant;
    }
    if (in_range(ch, kConjoiningVowelFirst, kConjoiningVowelLast)) {
        return CodepointRole::Vowel;
    }
    if (in_range(ch, kConjoiningTailBase + 1, kConjoiningTailLast)) {
        return CodepointRole::TailConsonant;
    }
    if (in_range(ch, kSyllableBase, kSyllableLast)) {
        return CodepointRole::ComposedSyllable;
    }
    return CodepointRole::NonHangul;
}

bool is_hangul(char32_t ch) { return classify(ch) != CodepointRole::NonHangul; }

bool is_consonant(char32_t ch) {
    CodepointRole role = classify(ch);
    return role == CodepointRole::LeadConsonant || role == CodepointRole::TailConsonant;
}

std::optional<SyllableIndices> decompose(char32_t ch) {
    if (!in_range(ch, kSyllableBase, kSyllableLast)) {
        return std::nullopt;
    }
    int syllable_index = static_cast<int>(ch - kSyllableBase);
    SyllableIndices parts;
    parts.tail = syllable_index % kTailCount;
    parts.vowel = (syllable_index / kTailCount) % kVowelCount;
    parts.lead = syllable_index / (kTailCount * kVowelCount);
    return parts;
}

std::optional<char32_t> compose_syllable(const SyllableIndices& parts) {
    if (parts.lead < 0 || parts.lead >= kLeadCount || parts.vowel < 0 ||
        parts.vowel >= kVowelCount || parts.tail < 0 || parts.tail >= kTailCount) {
        return std::nullopt;
    }
    return static_cast<char32_t>(kSyllableBase +
                                 ((parts.lead * kVowelCount) + parts.vowel) * kTailCount +
                                 parts.tail);
}

bool is_null_onset(int lead_index) { return lead_index == kNullOnsetIndex; }

std::optional<int> lead_index(char32_t jamo) {
    auto it = CHOSEONG_INDEX.find(jamo);
    if (it != CHOSEONG_INDEX.end()) {
        return it->second;
    }
    if (in_range(jamo, kConjoiningLeadFirst, kConjoiningLeadLast)) {
        return static_cast<int>(jamo - kConjoiningLeadFirst);
    }
    return std::nullopt;
}

std::optional<int> vowel_index(char32_t jamo) {
    auto it = JUNGSEONG_INDEX.find(jamo);
    if (it != JUNGSEONG_INDEX.end()) {
        return it->second;
    }
    if (in_range(jamo, kConjoiningVowelFirst, kConjoiningVowelLast)) {
        return static_cast<int>(jamo - kConjoiningVowelFirst);
    }
    return std::nullopt;
}

std::optional<int> tail_index(char32_t jamo) {
    auto it = JONGSEONG_INDEX.find(jamo);
    if (it != JONGSEONG_INDEX.end()) {
        return it->second;
    }
    if (in_range(jamo, kConjoiningTailBase + 1, kConjoiningTailLast)) {
        return static_cast<int>(jamo - kConjoiningTailBase);
    }
    return std::nullopt;
}

std::optional<char32_t> lead_jamo(int index) {
    if (index < 0 || index >= kLeadCount) {
        return std::nullopt;
    }
    return CHO_LIST[index];
}

std::optional<char32_t> vowel_jamo(int index) {
    if (index < 0 || index >= kVowelCount) {
        return std::nullopt;
    }
    return JUNG_LIST[index];
}

std::optional<char32_t> tail_jamo(int index) {
    if (index <= 0 || index >= kTailCount) {
        return std::nullopt;
    }
    return JONG_LIST[index];
}

}  // namespace jamo
