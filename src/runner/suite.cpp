#include <conform/runner/suite.h>
#include <conform/fixture/json_reader.h>
#include <conform/serialize/test_format.h>

#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace conform::runner {

namespace {

using core::Severity;

struct ScriptMode {
    bool scripting_enabled;
    const char* label;
};

std::vector<ScriptMode> script_modes(fixture::ScriptDirective directive) {
    switch (directive) {
        case fixture::ScriptDirective::On:   return {{true, "on"}};
        case fixture::ScriptDirective::Off:  return {{false, "off"}};
        case fixture::ScriptDirective::Both: return {{true, "on"}, {false, "off"}};
    }
    return {};
}

Failure placeholder_failure(const std::filesystem::path& rel, size_t case_index, std::string input) {
    return Failure{rel, case_index, kNoVariantLabel, std::move(input),
                   kPlaceholderExpected, kPlaceholderActual};
}

std::string counts_message(const Summary& summary) {
    return std::to_string(summary.passed) + "/" + std::to_string(summary.total) + " passed";
}

// Decodes a JSON-dialect fixture down to its top-level object. Problems are
// recorded as a single failure for the file and std::nullopt is returned.
std::optional<fixture::Value> load_json_fixture(const std::filesystem::path& file,
                                                const std::filesystem::path& rel,
                                                const char* suite, Summary& summary,
                                                const FileRunOptions& options,
                                                core::DiagnosticEmitter& diagnostics) {
    auto fail = [&](const std::string& message) {
        diagnostics.emit_at(Severity::Error, "fixture", suite, {rel, 0}, message);
        summary.record_failure(placeholder_failure(rel, 0, message), options.max_failures);
    };

    std::string read_error;
    auto decoded = fixture::parse_json_file(file, &read_error);
    if (!decoded) {
        fail("read error: " + read_error);
        return std::nullopt;
    }
    if (!decoded->ok()) {
        fail("JSON parse error: " + decoded->error->describe());
        return std::nullopt;
    }
    if (!decoded->value->is_object()) {
        fail("top-level JSON is not an object");
        return std::nullopt;
    }
    const fixture::Value* tests = decoded->value->find("tests");
    if (!tests || !tests->is_array()) {
        fail("missing top-level tests array");
        return std::nullopt;
    }
    return std::move(decoded->value);
}

std::string string_member(const fixture::Value& test, std::string_view key) {
    const fixture::Value* member = test.find(key);
    if (member && member->is_string()) {
        return member->as_string();
    }
    return {};
}

} // namespace

std::string run_tree_case(html::Parser& parser, const fixture::TreeConstructionCase& tc,
                          bool scripting_enabled) {
    html::Options opts;
    opts.scripting_enabled = scripting_enabled;

    if (tc.fragment_context) {
        html::FragmentContext context{tc.fragment_context->ns, tc.fragment_context->tag_name};
        html::Parsed parsed = parser.parse_fragment(context, tc.data, opts);
        return serialize::to_test_format(parsed.tree);
    }
    html::Parsed parsed = parser.parse_document(tc.data, opts);
    return serialize::to_test_format(parsed.tree);
}

Summary run_tree_construction_file(const std::filesystem::path& file, html::Parser& parser,
                                   const FileRunOptions& options,
                                   core::DiagnosticEmitter& diagnostics) {
    Summary summary;
    const auto rel = fixture::relative_to_root(file, options.tests_root);

    std::string read_error;
    auto parsed = fixture::parse_tree_construction_file(file, &read_error);
    if (!parsed) {
        diagnostics.emit_at(Severity::Error, "fixture", "tree-construction", {rel, 0}, read_error);
        summary.record_failure(
            Failure{rel, 0, kNoVariantLabel, "(failed to read .dat: " + read_error + ")",
                    kPlaceholderExpected, kReadErrorActual},
            options.max_failures);
        return summary;
    }

    for (const auto& skipped : parsed->skipped) {
        diagnostics.emit_at(Severity::Warning, "fixture", "tree-construction",
                            {rel, skipped.line}, "skipped case: " + skipped.reason);
    }

    for (size_t i = 0; i < parsed->cases.size(); ++i) {
        if (options.fail_fast && summary.failed > 0) break;

        const auto& tc = parsed->cases[i];
        const std::string expected = serialize::normalize_tree_text(tc.expected);

        for (const auto& mode : script_modes(tc.script_directive)) {
            std::string actual;
            try {
                actual = serialize::normalize_tree_text(run_tree_case(parser, tc, mode.scripting_enabled));
            } catch (const std::exception& e) {
                diagnostics.emit_at(Severity::Error, "runner", "tree-construction", {rel, tc.line},
                                    "case " + std::to_string(i) + ": parser error: " + e.what());
                summary.record_failure(
                    Failure{rel, i, mode.label, tc.data, expected, std::string("(parser error: ") + e.what() + ")"},
                    options.max_failures);
                continue;
            }

            if (actual == expected) {
                summary.record_pass();
                continue;
            }
            summary.record_failure(Failure{rel, i, mode.label, tc.data, expected, std::move(actual)},
                                   options.max_failures);
        }
    }

    diagnostics.emit_at(Severity::Info, "runner", "tree-construction", {rel, 0}, counts_message(summary));
    return summary;
}

Summary run_tokenizer_file(const std::filesystem::path& file, const FileRunOptions& options,
                           core::DiagnosticEmitter& diagnostics) {
    Summary summary;
    const auto rel = fixture::relative_to_root(file, options.tests_root);
    auto root = load_json_fixture(file, rel, "tokenizer", summary, options, diagnostics);
    if (!root) return summary;

    const auto& tests = root->find("tests")->as_array();
    for (size_t i = 0; i < tests.size(); ++i) {
        if (options.fail_fast && summary.failed > 0) break;

        const fixture::Value& test = tests[i];
        std::string input = string_member(test, "input");

        size_t variants = 1;
        const fixture::Value* states = test.find("initialStates");
        if (states && states->is_array() && !states->as_array().empty()) {
            variants = states->as_array().size();
        }
        for (size_t v = 0; v < variants; ++v) {
            summary.record_failure(placeholder_failure(rel, i, input), options.max_failures);
        }
    }

    diagnostics.emit_at(Severity::Info, "runner", "tokenizer", {rel, 0}, counts_message(summary));
    return summary;
}

Summary run_serializer_file(const std::filesystem::path& file, const FileRunOptions& options,
                            core::DiagnosticEmitter& diagnostics) {
    Summary summary;
    const auto rel = fixture::relative_to_root(file, options.tests_root);
    auto root = load_json_fixture(file, rel, "serializer", summary, options, diagnostics);
    if (!root) return summary;

    const auto& tests = root->find("tests")->as_array();
    for (size_t i = 0; i < tests.size(); ++i) {
        if (options.fail_fast && summary.failed > 0) break;
        summary.record_failure(placeholder_failure(rel, i, string_member(tests[i], "description")),
                               options.max_failures);
    }

    diagnostics.emit_at(Severity::Info, "runner", "serializer", {rel, 0}, counts_message(summary));
    return summary;
}

Summary run_fixture_file(fixture::FixtureKind kind, const std::filesystem::path& file,
                         html::Parser& parser, const FileRunOptions& options,
                         core::DiagnosticEmitter& diagnostics) {
    switch (kind) {
        case fixture::FixtureKind::TreeConstruction:
            return run_tree_construction_file(file, parser, options, diagnostics);
        case fixture::FixtureKind::Tokenizer:
            return run_tokenizer_file(file, options, diagnostics);
        case fixture::FixtureKind::Serializer:
            return run_serializer_file(file, options, diagnostics);
    }
    return {};
}

} // namespace conform::runner
