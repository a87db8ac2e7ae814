#include <conform/core/text.h>

namespace conform::core {

namespace {

constexpr char32_t kReplacementCharacter = 0xFFFD;

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

template<typename Lines>
std::string join_lines_impl(const Lines& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}

} // namespace

bool is_ascii_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && is_ascii_whitespace(text[start])) {
        ++start;
    }
    return trim_end(text.substr(start));
}

std::string_view trim_end(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && is_ascii_whitespace(text[end - 1])) {
        --end;
    }
    return text.substr(0, end);
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string_view>& lines) {
    return join_lines_impl(lines);
}

std::string join_lines(const std::vector<std::string>& lines) {
    return join_lines_impl(lines);
}

void append_utf8(std::string& out, char32_t codepoint) {
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        codepoint = kReplacementCharacter;
    }

    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        size_t length = 0;
        char32_t cp = 0;
        char32_t min_value = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2; cp = lead & 0x1F; min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; cp = lead & 0x0F; min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; cp = lead & 0x07; min_value = 0x10000;
        } else {
            return false;
        }
        if (i + length > bytes.size()) return false;
        for (size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(bytes[i + k]);
            if (!is_continuation(byte)) return false;
            cp = (cp << 6) | (byte & 0x3F);
        }
        if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::u16string utf8_to_utf16(std::string_view utf8) {
    std::u16string result;
    result.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        auto lead = static_cast<unsigned char>(utf8[i]);
        char32_t cp = kReplacementCharacter;
        size_t length = 1;
        char32_t min_value = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
            min_value = 0x10000;
        } else {
            cp = kReplacementCharacter;
        }

        if (length > 1) {
            bool valid = i + length <= utf8.size();
            for (size_t k = 1; valid && k < length; ++k) {
                auto byte = static_cast<unsigned char>(utf8[i + k]);
                if (!is_continuation(byte)) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (byte & 0x3F);
            }
            if (!valid || cp < min_value || cp > 0x10FFFF ||
                (cp >= 0xD800 && cp <= 0xDFFF)) {
                // Resynchronize on the next byte.
                cp = kReplacementCharacter;
                length = 1;
            }
        }

        if (cp >= 0x10000) {
            char32_t v = cp - 0x10000;
            result += static_cast<char16_t>(0xD800 + (v >> 10));
            result += static_cast<char16_t>(0xDC00 + (v & 0x3FF));
        } else {
            result += static_cast<char16_t>(cp);
        }
        i += length;
    }
    return result;
}

} // namespace conform::core
