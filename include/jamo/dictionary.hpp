#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>

namespace jamo {

// Maps words to decomposed Jamo pronunciations such as "ㅎㅏ-ㄴ".
//
// Source format is one entry per line, the word and its pronunciation
// separated by two spaces. Lines starting with ";;;" are comments.
class PronunciationDictionary {
   public:
    PronunciationDictionary() = default;

    static PronunciationDictionary load(std::istream& stream);
    static PronunciationDictionary load_file(const std::string& path);

    void add(const std::string& word, const std::string& pronunciation);
    std::optional<std::string> find(const std::string& word) const;

    // Returns the word itself when it has no entry.
    std::string lookup(const std::string& word) const;
    std::string transliterate(const std::string& text) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

   private:
    std::unordered_map<std::string, std::string> entries_;
};

}  // namespace jamo
