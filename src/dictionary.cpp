#include "jamo/dictionary.hpp"

#include <fstream>
#include <istream>
#include <vector>

#include "jamo/config.hpp"
#include "jamo/util.hpp"

namespace jamo {
namespace {

constexpr const char* kCommentPrefix = ";;;";
constexpr const char* kSeparator = "  ";
constexpr const char* kPunctuation = ".,!?;:\"'()";

}  // namespace

PronunciationDictionary PronunciationDictionary::load(std::istream& stream) {
    PronunciationDictionary dictionary;
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(kCommentPrefix, 0) == 0) {
            continue;
        }
        auto sep = line.find(kSeparator);
        if (sep == std::string::npos) {
            continue;
        }
        std::string word = trim_copy(line.substr(0, sep));
        std::string pronunciation = trim_copy(line.substr(sep + 2));
        if (word.empty() || pronunciation.empty()) {
            continue;
        }
        dictionary.add(word, pronunciation);
    }
    return dictionary;
}

PronunciationDictionary PronunciationDictionary::load_file(const std::string& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw ConfigError("Failed to open dictionary: " + path);
    }
    return load(stream);
}

void PronunciationDictionary::add(const std::string& word, const std::string& pronunciation) {
    entries_[to_lower_copy(word)] = pronunciation;
}

std::optional<std::string> PronunciationDictionary::find(const std::string& word) const {
    auto it = entries_.find(to_lower_copy(trim_chars(word, kPunctuation)));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string PronunciationDictionary::lookup(const std::string& word) const {
    return find(word).value_or(word);
}

std::string PronunciationDictionary::transliterate(const std::string& text) const {
    std::vector<std::string> result;
    for (const auto& word : split_whitespace(text)) {
        result.push_back(lookup(word));
    }
    return join(result, " ");
}

}  // namespace jamo
