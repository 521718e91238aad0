#pragma once

#include <string>

#include "jamo/hangul.hpp"
#include "jamo/syllable.hpp"

namespace jamo {

// How far into the open syllable the most recent symbol reached. Empty means
// nothing is open: start of input or right after pass-through text.
enum class SyllablePos {
    Empty,
    AtLead,
    AtMedial,
    AtTail,
};

enum class Transition {
    Extend,
    FlushThenStart,
};

Transition next_transition(SyllablePos current, Slot incoming);
SyllablePos position_after(Slot slot);

struct ComposerOptions {
    // Placed right before a consonant Jamo to make it a tail, as in "ㅎㅏ-ㄴ".
    char32_t tail_marker = U'-';
};

class HangulComposer {
   public:
    explicit HangulComposer(ComposerOptions options = {});

    std::u32string compose(const std::u32string& input) const;
    std::string compose(const std::string& input) const;

    const ComposerOptions& options() const { return options_; }

   private:
    ComposerOptions options_;
};

// Composes decomposed Jamo phonemes into syllables:
//   compose_hangul("ㅈㅏㅁㅗ") == "자모"
std::string compose_hangul(const std::string& word);

}  // namespace jamo
