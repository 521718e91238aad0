#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "jamo/cli.hpp"
#include "jamo/composer.hpp"
#include "jamo/config.hpp"
#include "jamo/dictionary.hpp"

int main(int argc, char** argv) {
    using namespace jamo;
    try {
        CliOptions options = parse_arguments(argc, argv);
        if (options.show_help) {
            print_usage();
            return 0;
        }

        Config config = resolve_config(options);
        std::string warning;
        std::optional<PronunciationDictionary> dictionary = resolve_dictionary(config, &warning);
        if (!warning.empty()) {
            std::cerr << "Warning: " << warning << '\n';
        }
        HangulComposer composer(config.composer);

        auto emit = [&](const std::string& text) {
            std::string phonemes = dictionary ? dictionary->transliterate(text) : text;
            std::cout << composer.compose(phonemes) << '\n';
        };

        if (!options.inputs.empty()) {
            for (const auto& input : options.inputs) {
                emit(input);
            }
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                emit(line);
            }
        }
    } catch (const ConfigError& err) {
        std::cerr << "Configuration error: " << err.what() << '\n';
        return 2;
    } catch (const std::exception& err) {
        std::cerr << "Error: " << err.what() << '\n';
        return 1;
    }
    return 0;
}
