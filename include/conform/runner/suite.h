#pragma once
#include <conform/core/diagnostics.h>
#include <conform/fixture/dat_reader.h>
#include <conform/fixture/discovery.h>
#include <conform/html/parser.h>
#include <conform/runner/summary.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace conform::runner {

inline constexpr const char kPlaceholderExpected[] = "(implemented parser output)";
inline constexpr const char kPlaceholderActual[] = "(unimplemented)";
inline constexpr const char kNoVariantLabel[] = "n/a";
inline constexpr const char kReadErrorActual[] = "(read error)";

struct FileRunOptions {
    std::filesystem::path tests_root;
    size_t max_failures = 0;  // failure detail still allowed for this file
    bool fail_fast = false;
};

// Canonical actual output for one tree-construction case in one scripting
// mode. Parser exceptions propagate.
std::string run_tree_case(html::Parser& parser, const fixture::TreeConstructionCase& tc,
                          bool scripting_enabled);

// Executes every case of one .dat file. Cases with a Both directive run
// twice; fail-fast is only honoured between cases.
Summary run_tree_construction_file(const std::filesystem::path& file, html::Parser& parser,
                                   const FileRunOptions& options,
                                   core::DiagnosticEmitter& diagnostics);

// JSON-dialect suites. The parser seam has no tokenizer or serializer entry
// point, so each test variant is recorded as an unimplemented failure.
Summary run_tokenizer_file(const std::filesystem::path& file, const FileRunOptions& options,
                           core::DiagnosticEmitter& diagnostics);
Summary run_serializer_file(const std::filesystem::path& file, const FileRunOptions& options,
                            core::DiagnosticEmitter& diagnostics);

Summary run_fixture_file(fixture::FixtureKind kind, const std::filesystem::path& file,
                         html::Parser& parser, const FileRunOptions& options,
                         core::DiagnosticEmitter& diagnostics);

} // namespace conform::runner
