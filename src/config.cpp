#include "jamo/config.hpp"

#include <fstream>

#include "jamo/hangul.hpp"
#include "jamo/util.hpp"

namespace jamo {

ConfigError::ConfigError(const std::string& what) : std::runtime_error(what) {}

Config default_config() { return Config{}; }

char32_t parse_tail_marker(const std::string& value, const std::string& source) {
    std::u32string decoded = utf8_to_u32(value);
    if (decoded.size() != 1) {
        throw ConfigError("tail_marker must be a single character in " + source + ": '" +
                          value + "'");
    }
    if (is_hangul(decoded.front())) {
        throw ConfigError("tail_marker cannot be a Hangul character in " + source + ": '" +
                          value + "'");
    }
    return decoded.front();
}

Config load_config(const std::string& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw ConfigError("Failed to open config: " + path);
    }

    Config config = default_config();
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        std::string trimmed = trim_copy(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim_copy(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        if (section != "composer" && section != "dictionary") {
            continue;
        }
        auto eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            throw ConfigError("Invalid line in " + path + ": " + trimmed);
        }
        std::string key = trim_copy(trimmed.substr(0, eq_pos));
        std::string value = trim_copy(trimmed.substr(eq_pos + 1));

        if (section == "composer" && key == "tail_marker") {
            config.composer.tail_marker = parse_tail_marker(value, path);
        } else if (section == "dictionary" && key == "path") {
            if (value.empty()) {
                config.dictionary_path.reset();
            } else {
                config.dictionary_path = value;
            }
        }
    }

    return config;
}

}  // namespace jamo
