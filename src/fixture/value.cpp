#include <conform/fixture/value.h>

#include <cstdio>

namespace conform::fixture {

namespace {

void write_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

void write_value(std::string& out, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            out += "null";
            break;
        case Value::Type::Bool:
            out += value.as_bool() ? "true" : "false";
            break;
        case Value::Type::Integer:
            out += std::to_string(value.as_integer());
            break;
        case Value::Type::String:
            write_string(out, value.as_string());
            break;
        case Value::Type::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) out += ',';
                first = false;
                write_value(out, item);
            }
            out += ']';
            break;
        }
        case Value::Type::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, member] : value.as_object()) {
                if (!first) out += ',';
                first = false;
                write_string(out, key);
                out += ':';
                write_value(out, member);
            }
            out += '}';
            break;
        }
    }
}

} // namespace

const Value* Value::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    for (const auto& member : as_object()) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

std::string Value::to_json() const {
    std::string out;
    write_value(out, *this);
    return out;
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

const char* type_name(Value::Type type) {
    switch (type) {
        case Value::Type::Null:    return "null";
        case Value::Type::Bool:    return "bool";
        case Value::Type::Integer: return "integer";
        case Value::Type::String:  return "string";
        case Value::Type::Array:   return "array";
        case Value::Type::Object:  return "object";
    }
    return "unknown";
}

} // namespace conform::fixture
