#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "jamo/composer.hpp"

namespace jamo {

struct Config {
    ComposerOptions composer;
    std::optional<std::string> dictionary_path;
};

class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& what);
};

Config load_config(const std::string& path);
Config default_config();

char32_t parse_tail_marker(const std::string& value, const std::string& source);

}  // namespace jamo
