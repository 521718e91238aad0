#pragma once

#include <optional>

#include "jamo/hangul.hpp"

namespace jamo {

enum class Slot {
    Lead,
    Medial,
    Tail,
};

class SyllableBuffer {
   public:
    SyllableBuffer() = default;

    bool empty() const;
    // A lead consonant is buffered but no vowel has arrived yet.
    bool awaiting_vowel() const;

    std::optional<char32_t> get(Slot slot) const;
    void set(Slot slot, char32_t jamo);

    void load(const SyllableIndices& parts);
    void attach_vowel_carrier(const SyllableIndices& parts);

    std::optional<char32_t> flush();
    void clear();

   private:
    std::optional<char32_t> leading_;
    std::optional<char32_t> vowel_;
    std::optional<char32_t> trailing_;
};

// Missing or unusable slots fall back to ㅇ for the lead and ㅡ for the vowel.
// Returns nothing for an empty buffer.
std::optional<char32_t> synthesize(const SyllableBuffer& buffer);

}  // namespace jamo
