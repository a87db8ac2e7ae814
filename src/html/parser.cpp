#include <conform/html/parser.h>

#include <utility>

namespace conform::html {

namespace {

std::vector<ParseError> placeholder_errors(const Options& options) {
    std::vector<ParseError> errors;
    if (options.collect_errors) {
        errors.push_back({"unimplemented", {1, 1}});
    }
    return errors;
}

} // namespace

Parsed PlaceholderParser::parse_document(std::string_view, const Options& options) {
    return Parsed{dom::Tree::new_document(), placeholder_errors(options)};
}

Parsed PlaceholderParser::parse_fragment(const FragmentContext&, std::string_view,
                                         const Options& options) {
    return Parsed{dom::Tree::new_fragment(), placeholder_errors(options)};
}

ParserFactory placeholder_parser_factory() {
    return []() -> std::unique_ptr<Parser> { return std::make_unique<PlaceholderParser>(); };
}

} // namespace conform::html
