#include <conform/fixture/dat_reader.h>
#include <conform/fixture/discovery.h>
#include <conform/core/text.h>

#include <utility>

namespace conform::fixture {

namespace {

constexpr std::string_view kData = "#data";
constexpr std::string_view kErrors = "#errors";
constexpr std::string_view kNewErrors = "#new-errors";
constexpr std::string_view kDocumentFragment = "#document-fragment";
constexpr std::string_view kScriptOn = "#script-on";
constexpr std::string_view kScriptOff = "#script-off";
constexpr std::string_view kDocument = "#document";

// Forward cursor over the lines of a .dat file.
class LineCursor {
public:
    explicit LineCursor(std::string_view content)
        : lines_(core::split_lines(content)) {}

    bool at_end() const { return pos_ >= lines_.size(); }

    std::optional<std::string_view> peek() const {
        if (at_end()) return std::nullopt;
        return lines_[pos_];
    }

    std::optional<std::string_view> next() {
        if (at_end()) return std::nullopt;
        return lines_[pos_++];
    }

    bool next_is(std::string_view marker) const {
        return !at_end() && lines_[pos_] == marker;
    }

    // 1-based number of the line returned by the last next().
    size_t line_number() const { return pos_; }

    size_t position() const { return pos_; }
    void rewind(size_t pos) { pos_ = pos; }

private:
    std::vector<std::string_view> lines_;
    size_t pos_ = 0;
};

// Counts non-blank lines up to the next section marker.
size_t count_error_lines(LineCursor& cursor) {
    size_t count = 0;
    while (auto line = cursor.peek()) {
        if (is_section_marker(*line)) break;
        cursor.next();
        if (!core::trim(*line).empty()) {
            ++count;
        }
    }
    return count;
}

std::string normalize_expected(const std::vector<std::string_view>& lines) {
    size_t begin = 0;
    size_t end = lines.size();
    while (begin < end && core::trim(lines[begin]).empty()) ++begin;
    while (end > begin && core::trim(lines[end - 1]).empty()) --end;

    std::vector<std::string_view> kept;
    kept.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        kept.push_back(core::trim_end(lines[i]));
    }
    return core::join_lines(kept);
}

} // namespace

const char* script_directive_name(ScriptDirective directive) {
    switch (directive) {
        case ScriptDirective::On:   return "on";
        case ScriptDirective::Off:  return "off";
        case ScriptDirective::Both: return "both";
    }
    return "unknown";
}

bool is_section_marker(std::string_view line) {
    return line == kData || line == kErrors || line == kNewErrors ||
           line == kDocumentFragment || line == kScriptOn ||
           line == kScriptOff || line == kDocument;
}

FragmentContextSpec parse_fragment_context_line(std::string_view line) {
    std::string_view s = core::trim(line);
    FragmentContextSpec spec;
    if (s.substr(0, 4) == "svg ") {
        spec.ns = "svg";
        spec.tag_name = std::string(s.substr(4));
    } else if (s.substr(0, 5) == "math ") {
        spec.ns = "math";
        spec.tag_name = std::string(s.substr(5));
    } else {
        spec.tag_name = std::string(s);
    }
    return spec;
}

DatParseResult parse_tree_construction_dat(std::string_view content) {
    DatParseResult result;
    LineCursor cursor(content);

    while (auto line = cursor.next()) {
        if (*line != kData) continue;

        const size_t case_line = cursor.line_number();
        const size_t resume_at = cursor.position();
        auto skip = [&](const char* reason) {
            result.skipped.push_back({case_line, reason});
        };

        std::vector<std::string_view> data_lines;
        while (!cursor.at_end() && !cursor.next_is(kErrors)) {
            data_lines.push_back(*cursor.next());
        }
        if (!cursor.next_is(kErrors)) {
            skip("missing #errors section");
            cursor.rewind(resume_at);
            continue;
        }
        cursor.next();

        TreeConstructionCase tc;
        tc.line = case_line;
        tc.data = core::join_lines(data_lines);

        tc.error_count = count_error_lines(cursor);
        if (cursor.next_is(kNewErrors)) {
            cursor.next();
            tc.error_count += count_error_lines(cursor);
        }

        if (cursor.next_is(kDocumentFragment)) {
            cursor.next();
            auto context_line = cursor.peek();
            if (!context_line || is_section_marker(*context_line) ||
                core::trim(*context_line).empty()) {
                skip("missing fragment context");
                continue;
            }
            cursor.next();
            tc.fragment_context = parse_fragment_context_line(*context_line);
            if (tc.fragment_context->tag_name.empty()) {
                skip("missing fragment context");
                continue;
            }
        }

        if (cursor.next_is(kScriptOn)) {
            tc.script_directive = ScriptDirective::On;
            cursor.next();
        } else if (cursor.next_is(kScriptOff)) {
            tc.script_directive = ScriptDirective::Off;
            cursor.next();
        }

        if (!cursor.next_is(kDocument)) {
            // The offending line is consumed unless it starts the next case.
            if (!cursor.next_is(kData)) cursor.next();
            skip("missing #document section");
            continue;
        }
        cursor.next();

        std::vector<std::string_view> expected_lines;
        while (!cursor.at_end() && !cursor.next_is(kData)) {
            expected_lines.push_back(*cursor.next());
        }
        tc.expected = normalize_expected(expected_lines);

        result.cases.push_back(std::move(tc));
    }

    return result;
}

std::optional<DatParseResult> parse_tree_construction_file(const std::filesystem::path& path,
                                                           std::string* read_error) {
    auto content = read_fixture_file(path, read_error);
    if (!content) return std::nullopt;
    return parse_tree_construction_dat(*content);
}

} // namespace conform::fixture
