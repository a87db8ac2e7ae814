#pragma once
#include <conform/dom/tree.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::html {

struct Options {
    bool scripting_enabled = false;
    bool iframe_srcdoc = false;
    bool collect_errors = false;
};

struct Location {
    uint32_t line = 0;
    uint32_t col = 0;

    bool operator==(const Location&) const = default;
};

struct ParseError {
    std::string code;
    Location location;
};

struct FragmentContext {
    std::optional<std::string> ns;  // "svg", "math" or none for HTML
    std::string tag_name;
};

struct Parsed {
    dom::Tree tree;
    std::vector<ParseError> errors;
};

// The parsing engine under test. Implementations need not be thread-safe:
// every worker obtains its own instance from a ParserFactory.
class Parser {
public:
    virtual ~Parser() = default;

    virtual Parsed parse_document(std::string_view input, const Options& options) = 0;
    virtual Parsed parse_fragment(const FragmentContext& context, std::string_view input,
                                  const Options& options) = 0;
};

using ParserFactory = std::function<std::unique_ptr<Parser>()>;

// Stand-in used until a real engine is linked: yields an empty document or
// fragment, plus a single "unimplemented" error at 1:1 when errors are
// collected.
class PlaceholderParser : public Parser {
public:
    Parsed parse_document(std::string_view input, const Options& options) override;
    Parsed parse_fragment(const FragmentContext& context, std::string_view input,
                          const Options& options) override;
};

ParserFactory placeholder_parser_factory();

} // namespace conform::html
