#include <conform/runner/commands.h>
#include <conform/core/config.h>
#include <conform/fixture/dat_reader.h>
#include <conform/fixture/json_reader.h>
#include <conform/runner/engine.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace conform::runner {

namespace {

using core::config::kExitFailures;
using core::config::kExitSuccess;
using core::config::kExitUsage;

// Number of entries in the top-level "tests" array, 0 when the file does
// not decode to that shape.
size_t json_test_count(const std::filesystem::path& file) {
    auto decoded = fixture::parse_json_file(file);
    if (!decoded || !decoded->ok() || !decoded->value->is_object()) return 0;
    const fixture::Value* tests = decoded->value->find("tests");
    if (!tests || !tests->is_array()) return 0;
    return tests->as_array().size();
}

bool smoke_tree_file(const std::filesystem::path& file, std::ostream& err) {
    std::string read_error;
    auto parsed = fixture::parse_tree_construction_file(file, &read_error);
    if (!parsed) {
        err << "tree .dat read error: " << file.string() << ": " << read_error << "\n";
        return false;
    }
    for (const auto& skipped : parsed->skipped) {
        err << "tree .dat parse error: " << file.string() << ":" << skipped.line << ": "
            << skipped.reason << "\n";
    }
    return parsed->skipped.empty();
}

bool smoke_json_file(fixture::FixtureKind kind, const std::filesystem::path& file,
                     std::ostream& err) {
    std::string read_error;
    auto decoded = fixture::parse_json_file(file, &read_error);
    if (!decoded) {
        err << fixture::kind_name(kind) << " .test read error: " << file.string() << ": "
            << read_error << "\n";
        return false;
    }
    if (!decoded->ok()) {
        err << fixture::kind_name(kind) << " .test JSON parse error: " << file.string() << ": "
            << decoded->error->describe() << "\n";
        return false;
    }
    return true;
}

std::string fragment_description(const fixture::TreeConstructionCase& tc) {
    if (!tc.fragment_context) return "(none)";
    const std::string ns = tc.fragment_context->ns ? *tc.fragment_context->ns : "html";
    return "ns=" + ns + " tag=" + tc.fragment_context->tag_name;
}

} // namespace

std::vector<std::filesystem::path> collect_files(const RunConfig& config,
                                                 fixture::FixtureKind kind) {
    auto files = fixture::discover_fixture_files(config.tests_root, kind);
    if (config.filter) {
        const std::string& needle = *config.filter;
        files.erase(std::remove_if(files.begin(), files.end(),
                                   [&](const std::filesystem::path& file) {
                                       return file.string().find(needle) == std::string::npos;
                                   }),
                    files.end());
    }
    return files;
}

int list_files(const RunConfig& config, std::ostream& out, std::ostream& err) {
    for (auto kind : config.suites()) {
        try {
            out << fixture::kind_name(kind) << " files: " << collect_files(config, kind).size()
                << "\n";
        } catch (const std::filesystem::filesystem_error& e) {
            err << "failed to discover " << fixture::kind_name(kind) << " files: " << e.what()
                << "\n";
            return kExitUsage;
        }
    }
    return kExitSuccess;
}

int list_cases(const RunConfig& config, std::ostream& out, std::ostream& err) {
    for (auto kind : config.suites()) {
        std::vector<std::filesystem::path> files;
        try {
            files = collect_files(config, kind);
        } catch (const std::filesystem::filesystem_error& e) {
            err << "failed to discover " << fixture::kind_name(kind) << " files: " << e.what()
                << "\n";
            return kExitUsage;
        }

        out << fixture::kind_name(kind) << ":\n";
        for (const auto& file : files) {
            const std::string rel = fixture::relative_to_root(file, config.tests_root).generic_string();
            if (kind == fixture::FixtureKind::TreeConstruction) {
                std::string read_error;
                auto parsed = fixture::parse_tree_construction_file(file, &read_error);
                if (parsed) {
                    out << "  " << rel << ": " << parsed->cases.size() << " cases\n";
                } else {
                    out << "  " << rel << ": (error: " << read_error << ")\n";
                }
            } else {
                out << "  " << rel << ": " << json_test_count(file) << " tests\n";
            }
        }
    }
    return kExitSuccess;
}

int show_case(const RunConfig& config, const ShowRequest& request, std::ostream& out,
              std::ostream& err) {
    if (request.suite != fixture::FixtureKind::TreeConstruction) {
        err << "--show is only supported for suite 'tree'\n";
        return kExitUsage;
    }

    const std::filesystem::path path =
        request.file.is_absolute() ? request.file : config.tests_root / request.file;
    std::string read_error;
    auto parsed = fixture::parse_tree_construction_file(path, &read_error);
    if (!parsed) {
        err << "failed to read " << path.string() << ": " << read_error << "\n";
        return kExitUsage;
    }
    if (request.case_index >= parsed->cases.size()) {
        err << "case index out of range (" << parsed->cases.size() << " cases)\n";
        return kExitUsage;
    }

    const auto& tc = parsed->cases[request.case_index];
    out << "file: " << request.file.generic_string() << "\n";
    out << "case: " << request.case_index << "\n";
    out << "script: " << fixture::script_directive_name(tc.script_directive) << "\n";
    out << "fragment: " << fragment_description(tc) << "\n";
    out << "\n#data\n" << tc.data << "\n\n#document\n" << tc.expected << "\n";
    return kExitSuccess;
}

int run_smoke(const RunConfig& config, std::ostream& out, std::ostream& err) {
    bool ok = true;
    for (auto kind : config.suites()) {
        std::vector<std::filesystem::path> files;
        try {
            files = collect_files(config, kind);
        } catch (const std::filesystem::filesystem_error& e) {
            err << "failed to discover " << fixture::kind_name(kind) << " files: " << e.what()
                << "\n";
            return kExitUsage;
        }

        size_t decoded = 0;
        for (const auto& file : files) {
            const bool file_ok = kind == fixture::FixtureKind::TreeConstruction
                                     ? smoke_tree_file(file, err)
                                     : smoke_json_file(kind, file, err);
            if (file_ok) ++decoded;
            ok = ok && file_ok;
        }
        out << fixture::kind_name(kind) << ": " << decoded << "/" << files.size()
            << " files decoded\n";
    }
    return ok ? kExitSuccess : kExitFailures;
}

int run_suites(const RunConfig& config, const html::ParserFactory& make_parser,
               core::DiagnosticEmitter& diagnostics, std::ostream& out, std::ostream& err) {
    if (config.run_tokenizer || config.run_serializer) {
        diagnostics.emit(core::Severity::Warning, "runner", "run",
                         "tokenizer/serializer execution is not implemented; "
                         "use --smoke to validate fixture decoding");
    }

    EngineOptions options;
    options.tests_root = config.tests_root;
    options.workers = config.threads;
    options.max_failures = config.max_failures;
    options.fail_fast = config.fail_fast;

    std::vector<SuiteOutcome> outcomes;
    for (auto kind : config.suites()) {
        std::vector<std::filesystem::path> files;
        try {
            files = collect_files(config, kind);
        } catch (const std::filesystem::filesystem_error& e) {
            err << "failed to discover " << fixture::kind_name(kind) << " files: " << e.what()
                << "\n";
            return kExitUsage;
        }

        SuiteOutcome outcome;
        outcome.kind = kind;
        try {
            outcome.summary = run_suite(kind, files, options, make_parser, diagnostics);
        } catch (const std::runtime_error& e) {
            err << fixture::kind_name(kind) << " run aborted: " << e.what() << "\n";
            return kExitUsage;
        }
        outcomes.push_back(std::move(outcome));

        if (config.fail_fast && outcomes.back().summary.failed > 0) break;
    }

    write_report(out, outcomes, config.max_failures, config.verbose);
    return any_failed(outcomes) ? kExitFailures : kExitSuccess;
}

int run_command(const RunConfig& config, const html::ParserFactory& make_parser,
                core::DiagnosticEmitter& diagnostics, std::ostream& out, std::ostream& err) {
    if (config.show) return show_case(config, *config.show, out, err);
    if (config.smoke) return run_smoke(config, out, err);
    if (config.list_only) return list_files(config, out, err);
    if (config.list_cases) return list_cases(config, out, err);
    return run_suites(config, make_parser, diagnostics, out, err);
}

} // namespace conform::runner
