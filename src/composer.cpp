#include "jamo/composer.hpp"

#include <optional>

#include "jamo/util.hpp"

namespace jamo {
namespace {

// Rows: current position. Columns: slot of the incoming Jamo.
// A symbol that does not move forward through lead, medial, tail starts a new
// syllable. The tail slot is always empty at AtMedial, so a tail after a
// vowel extends the open syllable.
constexpr Transition EXTEND = Transition::Extend;
constexpr Transition FLUSH = Transition::FlushThenStart;

const Transition TRANSITIONS[4][3] = {
    // Lead  Medial  Tail
    {EXTEND, EXTEND, EXTEND},  // Empty
    {FLUSH, EXTEND, EXTEND},   // AtLead
    {FLUSH, FLUSH, EXTEND},    // AtMedial
    {FLUSH, FLUSH, FLUSH},     // AtTail
};

struct Symbol {
    char32_t ch = U'\0';
    bool marked_tail = false;
};

class CompositionRun {
   public:
    CompositionRun(const std::u32string& input, const ComposerOptions& options)
        : input_(input), options_(options) {}

    std::u32string run();

   private:
    std::optional<Symbol> read();
    void write();

    void handle_passthrough(char32_t ch);
    void handle_composed(char32_t ch);
    void handle_jamo(const Symbol& symbol, CodepointRole role);

    const std::u32string& input_;
    const ComposerOptions& options_;
    size_t cursor_ = 0;

    SyllableBuffer buffer_;
    SyllablePos position_ = SyllablePos::Empty;
    std::u32string output_;
};

std::u32string CompositionRun::run() {
    while (auto symbol = read()) {
        CodepointRole role = classify(symbol->ch);
        switch (role) {
            case CodepointRole::NonHangul:
                handle_passthrough(symbol->ch);
                break;
            case CodepointRole::ComposedSyllable:
                handle_composed(symbol->ch);
                break;
            case CodepointRole::LeadConsonant:
            case CodepointRole::Vowel:
            case CodepointRole::TailConsonant:
                handle_jamo(*symbol, role);
                break;
        }
    }

    if (position_ != SyllablePos::Empty) {
        write();
    }
    return output_;
}

// The tail marker is only consumed when a consonant Jamo follows it; anywhere
// else it is ordinary text.
std::optional<Symbol> CompositionRun::read() {
    if (cursor_ >= input_.size()) {
        return std::nullopt;
    }
    Symbol symbol;
    symbol.ch = input_[cursor_++];
    if (symbol.ch == options_.tail_marker && cursor_ < input_.size() &&
        is_consonant(input_[cursor_])) {
        symbol.ch = input_[cursor_++];
        symbol.marked_tail = true;
    }
    return symbol;
}

void CompositionRun::write() {
    if (auto letter = buffer_.flush()) {
        output_.push_back(*letter);
    }
}

void CompositionRun::handle_passthrough(char32_t ch) {
    if (position_ != SyllablePos::Empty) {
        write();
    }
    output_.push_back(ch);
    position_ = SyllablePos::Empty;
}

void CompositionRun::handle_composed(char32_t ch) {
    // classify() only reports ComposedSyllable inside the syllable range.
    SyllableIndices parts = *decompose(ch);

    // A vowel written as a full syllable (아, 안) completes a bare lead
    // consonant that is still waiting for its vowel.
    if (buffer_.awaiting_vowel() && is_null_onset(parts.lead)) {
        buffer_.attach_vowel_carrier(parts);
    } else {
        write();
        buffer_.load(parts);
    }
    position_ = SyllablePos::AtTail;
}

void CompositionRun::handle_jamo(const Symbol& symbol, CodepointRole role) {
    Slot slot = Slot::Lead;
    if (role == CodepointRole::Vowel) {
        slot = Slot::Medial;
    } else if (role == CodepointRole::TailConsonant) {
        slot = Slot::Tail;
    } else if (symbol.marked_tail && tail_index(symbol.ch)) {
        // A marked ㄸ ㅃ ㅉ has no tail form and stays a lead.
        slot = Slot::Tail;
    }

    if (next_transition(position_, slot) == Transition::FlushThenStart) {
        write();
    }
    buffer_.set(slot, symbol.ch);
    position_ = position_after(slot);
}

}  // namespace

Transition next_transition(SyllablePos current, Slot incoming) {
    return TRANSITIONS[static_cast<int>(current)][static_cast<int>(incoming)];
}

SyllablePos position_after(Slot slot) {
    switch (slot) {
        case Slot::Lead:
            return SyllablePos::AtLead;
        case Slot::Medial:
            return SyllablePos::AtMedial;
        case Slot::Tail:
            return SyllablePos::AtTail;
    }
    return SyllablePos::Empty;
}

HangulComposer::HangulComposer(ComposerOptions options) : options_(options) {}

std::u32string HangulComposer::compose(const std::u32string& input) const {
    CompositionRun run(input, options_);
    return run.run();
}

std::string HangulComposer::compose(const std::string& input) const {
    return utf8_from_u32string(compose(utf8_to_u32(input)));
}

std::string compose_hangul(const std::string& word) {
    HangulComposer composer;
    return composer.compose(word);
}

}  // namespace jamo
