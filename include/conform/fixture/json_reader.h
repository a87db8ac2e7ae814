#pragma once
#include <conform/fixture/value.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace conform::fixture {

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& message, size_t offset);

    // Byte offset into the input at which decoding stopped.
    size_t offset() const { return offset_; }

    // "<message> @<offset>"
    std::string describe() const;

private:
    size_t offset_;
};

struct JsonResult {
    std::optional<Value> value;
    std::optional<JsonParseError> error;

    bool ok() const { return value.has_value(); }
};

// Decodes a complete JSON document. Numbers must be integers: a literal
// with a fraction or exponent is rejected rather than truncated.
JsonResult parse_json(std::string_view input);

// Reads and decodes `path`. Returns std::nullopt, with `read_error` filled
// in, only when the file itself cannot be read.
std::optional<JsonResult> parse_json_file(const std::filesystem::path& path,
                                          std::string* read_error = nullptr);

} // namespace conform::fixture
