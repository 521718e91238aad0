#include "jamo/syllable.hpp"

namespace jamo {

bool SyllableBuffer::empty() const { return !leading_ && !vowel_ && !trailing_; }

bool SyllableBuffer::awaiting_vowel() const { return leading_.has_value() && !vowel_; }

std::optional<char32_t> SyllableBuffer::get(Slot slot) const {
    switch (slot) {
        case Slot::Lead:
            return leading_;
        case Slot::Medial:
            return vowel_;
        case Slot::Tail:
            return trailing_;
    }
    return std::nullopt;
}

void SyllableBuffer::set(Slot slot, char32_t jamo) {
    switch (slot) {
        case Slot::Lead:
            leading_ = jamo;
            break;
        case Slot::Medial:
            vowel_ = jamo;
            break;
        case Slot::Tail:
            trailing_ = jamo;
            break;
    }
}

void SyllableBuffer::load(const SyllableIndices& parts) {
    leading_ = lead_jamo(parts.lead);
    vowel_ = vowel_jamo(parts.vowel);
    trailing_ = tail_jamo(parts.tail);
}

void SyllableBuffer::attach_vowel_carrier(const SyllableIndices& parts) {
    vowel_ = vowel_jamo(parts.vowel);
    trailing_ = tail_jamo(parts.tail);
}

std::optional<char32_t> SyllableBuffer::flush() {
    std::optional<char32_t> letter = synthesize(*this);
    clear();
    return letter;
}

void SyllableBuffer::clear() {
    leading_.reset();
    vowel_.reset();
    trailing_.reset();
}

std::optional<char32_t> synthesize(const SyllableBuffer& buffer) {
    if (buffer.empty()) {
        return std::nullopt;
    }

    SyllableIndices parts;
    parts.lead = kNullOnsetIndex;
    parts.vowel = kFillerVowelIndex;
    parts.tail = 0;

    if (auto lead = buffer.get(Slot::Lead)) {
        parts.lead = lead_index(*lead).value_or(kNullOnsetIndex);
    }
    if (auto vowel = buffer.get(Slot::Medial)) {
        parts.vowel = vowel_index(*vowel).value_or(kFillerVowelIndex);
    }
    // The composer only stores consonants that can close a syllable here.
    if (auto tail = buffer.get(Slot::Tail)) {
        parts.tail = tail_index(*tail).value_or(0);
    }
    return compose_syllable(parts);
}

}  // namespace jamo
