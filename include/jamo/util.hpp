#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jamo {

std::string utf8_from_char32(char32_t codepoint);
std::string utf8_from_u32string(const std::u32string& value);
std::u32string utf8_to_u32(const std::string& value);

std::string trim_copy(std::string_view text);
std::string trim_chars(std::string_view text, std::string_view chars);
std::string to_lower_copy(std::string_view text);
std::vector<std::string> split_whitespace(std::string_view text);
std::string join(const std::vector<std::string>& parts, std::string_view separator);

}  // namespace jamo
