#pragma once

#include <optional>
#include <string>
#include <vector>

#include "jamo/config.hpp"
#include "jamo/dictionary.hpp"

namespace jamo {

struct CliOptions {
    bool show_help = false;
    std::optional<std::string> config_path;
    std::optional<std::string> dictionary_path;
    std::optional<std::string> tail_marker;
    std::vector<std::string> inputs;
};

CliOptions parse_arguments(int argc, char** argv);
void print_usage();

// Explicit --config, else ./jamo.ini when present, else defaults; command-line
// values win over the file.
Config resolve_config(const CliOptions& options);
std::optional<PronunciationDictionary> resolve_dictionary(const Config& config,
                                                          std::string* warning = nullptr);

}  // namespace jamo
