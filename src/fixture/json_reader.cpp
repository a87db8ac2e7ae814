#include <conform/fixture/json_reader.h>
#include <conform/fixture/discovery.h>
#include <conform/core/text.h>

#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

namespace conform::fixture {

namespace {

constexpr size_t kMaxNestingDepth = 512;

class JsonReader {
public:
    explicit JsonReader(std::string_view input) : input_(input) {}

    Value read_document() {
        skip_ws();
        Value value = read_value();
        skip_ws();
        if (pos_ != input_.size()) {
            fail("trailing characters");
        }
        return value;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t depth_ = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw JsonParseError(message, pos_);
    }

    bool at_end() const { return pos_ >= input_.size(); }
    char peek() const { return input_[pos_]; }

    char bump(const char* eof_message) {
        if (at_end()) fail(eof_message);
        return input_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
            } else {
                break;
            }
        }
    }

    bool consume_literal(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    Value read_value() {
        skip_ws();
        if (at_end()) fail("unexpected EOF");

        char c = peek();
        switch (c) {
            case 'n':
                if (!consume_literal("null")) fail("expected null");
                return Value();
            case 't':
            case 'f':
                if (consume_literal("true")) return Value(true);
                if (consume_literal("false")) return Value(false);
                fail("expected boolean");
            case '"':
                return Value(read_string());
            case '[':
                return read_array();
            case '{':
                return read_object();
            default:
                if (c == '-' || (c >= '0' && c <= '9')) {
                    return read_number();
                }
                fail("unexpected character");
        }
    }

    Value read_number() {
        size_t start = pos_;
        if (peek() == '-') ++pos_;

        bool saw_digit = false;
        while (!at_end() && peek() >= '0' && peek() <= '9') {
            saw_digit = true;
            ++pos_;
        }
        if (!saw_digit) fail("expected digits");

        if (!at_end() && (peek() == '.' || peek() == 'e' || peek() == 'E')) {
            fail("non-integer numbers not supported");
        }

        int64_t n = 0;
        const char* begin = input_.data() + start;
        const char* end = input_.data() + pos_;
        auto result = std::from_chars(begin, end, n);
        if (result.ec != std::errc() || result.ptr != end) {
            fail("invalid number");
        }
        return Value(n);
    }

    uint16_t read_hex_u16() {
        uint16_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = bump("unexpected EOF in \\u");
            uint16_t digit = 0;
            if (c >= '0' && c <= '9') {
                digit = static_cast<uint16_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                digit = static_cast<uint16_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                digit = static_cast<uint16_t>(c - 'A' + 10);
            } else {
                fail("invalid hex digit");
            }
            v = static_cast<uint16_t>((v << 4) | digit);
        }
        return v;
    }

    void read_unicode_escape(std::string& out) {
        uint16_t code = read_hex_u16();

        if (code >= 0xD800 && code <= 0xDBFF) {
            if (at_end() || bump("expected low surrogate") != '\\' ||
                at_end() || bump("expected low surrogate") != 'u') {
                fail("expected low surrogate");
            }
            uint16_t low = read_hex_u16();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            char32_t hi = code - 0xD800;
            char32_t lo = low - 0xDC00;
            core::append_utf8(out, 0x10000 + ((hi << 10) | lo));
            return;
        }

        if (code >= 0xDC00 && code <= 0xDFFF) {
            fail("invalid codepoint");
        }
        core::append_utf8(out, code);
    }

    std::string read_string() {
        if (bump("expected '\"'") != '"') fail("expected '\"'");

        std::string out;
        while (!at_end()) {
            char c = input_[pos_++];
            if (c == '"') {
                if (!core::is_valid_utf8(out)) fail("invalid utf-8");
                return out;
            }
            if (c == '\\') {
                char esc = bump("unexpected EOF in escape");
                switch (esc) {
                    case '"':  out += '"'; break;
                    case '\\': out += '\\'; break;
                    case '/':  out += '/'; break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    case 'u':  read_unicode_escape(out); break;
                    default:   fail("unknown escape");
                }
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            out += c;
        }
        fail("unexpected EOF in string");
    }

    void enter() {
        if (++depth_ > kMaxNestingDepth) fail("nesting too deep");
    }

    Value read_array() {
        bump("expected '['");
        enter();
        skip_ws();

        Value::Array items;
        if (!at_end() && peek() == ']') {
            ++pos_;
            --depth_;
            return Value(std::move(items));
        }

        while (true) {
            items.push_back(read_value());
            skip_ws();
            char c = bump("unexpected EOF in array");
            if (c == ',') {
                skip_ws();
                continue;
            }
            if (c == ']') break;
            fail("expected ',' or ']'");
        }
        --depth_;
        return Value(std::move(items));
    }

    Value read_object() {
        bump("expected '{'");
        enter();
        skip_ws();

        Value::Object members;
        if (!at_end() && peek() == '}') {
            ++pos_;
            --depth_;
            return Value(std::move(members));
        }

        while (true) {
            skip_ws();
            std::string key = read_string();
            skip_ws();
            if (bump("expected ':'") != ':') fail("expected ':'");
            Value value = read_value();
            members.emplace_back(std::move(key), std::move(value));
            skip_ws();
            char c = bump("unexpected EOF in object");
            if (c == ',') {
                skip_ws();
                continue;
            }
            if (c == '}') break;
            fail("expected ',' or '}'");
        }
        --depth_;
        return Value(std::move(members));
    }
};

} // namespace

JsonParseError::JsonParseError(const std::string& message, size_t offset)
    : std::runtime_error(message)
    , offset_(offset) {}

std::string JsonParseError::describe() const {
    return std::string(what()) + " @" + std::to_string(offset_);
}

JsonResult parse_json(std::string_view input) {
    JsonResult result;
    try {
        JsonReader reader(input);
        result.value = reader.read_document();
    } catch (const JsonParseError& e) {
        result.error = e;
    }
    return result;
}

std::optional<JsonResult> parse_json_file(const std::filesystem::path& path,
                                          std::string* read_error) {
    auto content = read_fixture_file(path, read_error);
    if (!content) return std::nullopt;
    return parse_json(*content);
}

} // namespace conform::fixture
