#include "jamo/cli.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace jamo {
namespace {

std::string extract_value(const std::string& arg, int& index, int argc, char** argv,
                          const std::string& name) {
    auto eq = arg.find('=');
    if (eq != std::string::npos) {
        return arg.substr(eq + 1);
    }
    if (index + 1 >= argc) {
        throw std::runtime_error("Option " + name + " requires a value");
    }
    ++index;
    return std::string(argv[index]);
}

bool matches_option(const std::string& arg, const std::string& name) {
    return arg == name || arg.rfind(name + "=", 0) == 0;
}

}  // namespace

CliOptions parse_arguments(int argc, char** argv) {
    CliOptions options;
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || arg.size() < 2 || arg[0] != '-') {
            options.inputs.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (matches_option(arg, "--config")) {
            options.config_path = extract_value(arg, i, argc, argv, "--config");
        } else if (matches_option(arg, "--dict")) {
            options.dictionary_path = extract_value(arg, i, argc, argv, "--dict");
        } else if (matches_option(arg, "--tail-marker")) {
            options.tail_marker = extract_value(arg, i, argc, argv, "--tail-marker");
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }
    return options;
}

void print_usage() {
    std::cout << "jamo-compose - compose decomposed Hangul Jamo into syllables\n";
    std::cout << "Usage: jamo-compose [options] [TEXT...]\n\n";
    std::cout << "Composes each TEXT argument, or each line of standard input when none\n";
    std::cout << "is given. A consonant after the tail marker closes the open syllable:\n";
    std::cout << "  jamo-compose 'ㅎㅏ-ㄴㄱㅡ-ㄹ'   ->  한글\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH           Path to jamo.ini (default: ./jamo.ini if present)\n";
    std::cout << "  --dict PATH             Pronunciation dictionary applied before composing\n";
    std::cout << "  --tail-marker CHAR      Tail marker character (default: -)\n";
    std::cout << "  -h, --help              Show this help message\n";
}

Config resolve_config(const CliOptions& options) {
    Config config = default_config();
    if (options.config_path) {
        config = load_config(*options.config_path);
    } else {
        std::filesystem::path default_path = std::filesystem::current_path() / "jamo.ini";
        if (std::filesystem::exists(default_path)) {
            config = load_config(default_path.string());
        }
    }

    if (options.tail_marker) {
        config.composer.tail_marker = parse_tail_marker(*options.tail_marker, "--tail-marker");
    }
    if (options.dictionary_path) {
        config.dictionary_path = options.dictionary_path;
    }
    return config;
}

std::optional<PronunciationDictionary> resolve_dictionary(const Config& config,
                                                          std::string* warning) {
    if (!config.dictionary_path) {
        return std::nullopt;
    }
    PronunciationDictionary dictionary =
        PronunciationDictionary::load_file(*config.dictionary_path);
    if (dictionary.empty() && warning) {
        *warning = "dictionary '" + *config.dictionary_path +
                   "' has no entries; words pass through unchanged";
    }
    return dictionary;
}

}  // namespace jamo
