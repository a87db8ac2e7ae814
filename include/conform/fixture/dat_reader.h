#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::fixture {

enum class ScriptDirective { On, Off, Both };

const char* script_directive_name(ScriptDirective directive);

struct FragmentContextSpec {
    std::optional<std::string> ns;  // "svg", "math" or none
    std::string tag_name;

    bool operator==(const FragmentContextSpec& other) const = default;
};

// One #data ... #document block of a tree-construction .dat file.
struct TreeConstructionCase {
    std::string data;
    size_t error_count = 0;
    std::optional<FragmentContextSpec> fragment_context;
    ScriptDirective script_directive = ScriptDirective::Both;
    std::string expected;
    size_t line = 0;  // 1-based line of the #data marker
};

// A block that started with #data but did not follow the section grammar.
struct SkippedCase {
    size_t line = 0;  // 1-based line of the #data marker
    std::string reason;
};

struct DatParseResult {
    std::vector<TreeConstructionCase> cases;
    std::vector<SkippedCase> skipped;
};

bool is_section_marker(std::string_view line);

// "svg <tag>" / "math <tag>" select a namespace; anything else is a plain
// HTML tag name. Surrounding whitespace is ignored.
FragmentContextSpec parse_fragment_context_line(std::string_view line);

DatParseResult parse_tree_construction_dat(std::string_view content);

// Returns std::nullopt, with `read_error` filled in, when the file cannot be read.
std::optional<DatParseResult> parse_tree_construction_file(const std::filesystem::path& path,
                                                           std::string* read_error = nullptr);

} // namespace conform::fixture
