#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace conform::fixture {

// Decoded JSON-dialect fixture value. Objects keep their members in document
// order and may repeat a key; lookups return the first match.
class Value {
public:
    enum class Type { Null, Bool, Integer, String, Array, Object };

    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    explicit Value(bool b) : data_(b) {}
    explicit Value(int n) : data_(static_cast<int64_t>(n)) {}
    explicit Value(int64_t n) : data_(n) {}
    explicit Value(const char* s) : data_(std::string(s)) {}
    explicit Value(std::string s) : data_(std::move(s)) {}
    explicit Value(Array items) : data_(std::move(items)) {}
    explicit Value(Object members) : data_(std::move(members)) {}

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_null() const { return type() == Type::Null; }
    bool is_bool() const { return type() == Type::Bool; }
    bool is_integer() const { return type() == Type::Integer; }
    bool is_string() const { return type() == Type::String; }
    bool is_array() const { return type() == Type::Array; }
    bool is_object() const { return type() == Type::Object; }

    // Accessors throw std::bad_variant_access on a type mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }

    // First member named `key`, or nullptr when absent or not an object.
    const Value* find(std::string_view key) const;

    // Canonical compact encoding: no insignificant whitespace, members in
    // stored order, non-ASCII text emitted as raw UTF-8.
    std::string to_json() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, std::string, Array, Object> data_;
};

const char* type_name(Value::Type type);

} // namespace conform::fixture
