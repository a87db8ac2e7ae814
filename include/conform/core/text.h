#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace conform::core {

// Space, tab, LF, CR, FF and VT.
bool is_ascii_whitespace(char c);

std::string_view trim(std::string_view text);
std::string_view trim_end(std::string_view text);

// Splits on '\n' only. "a\nb\n" yields {"a", "b", ""}; CR bytes are kept.
std::vector<std::string_view> split_lines(std::string_view text);

std::string join_lines(const std::vector<std::string_view>& lines);
std::string join_lines(const std::vector<std::string>& lines);

// Appends the UTF-8 encoding of a scalar value. Values above U+10FFFF or in
// the surrogate range are written as U+FFFD.
void append_utf8(std::string& out, char32_t codepoint);

bool is_valid_utf8(std::string_view bytes);

// Converts UTF-8 to UTF-16 code units. Malformed sequences become U+FFFD.
std::u16string utf8_to_utf16(std::string_view utf8);

} // namespace conform::core
