#pragma once
#include <conform/core/diagnostics.h>
#include <conform/html/parser.h>
#include <conform/runner/report.h>
#include <conform/runner/run_config.h>

#include <filesystem>
#include <ostream>
#include <vector>

namespace conform::runner {

// Discovers one suite's files and applies the --filter substring to the
// full path. Throws std::filesystem::filesystem_error on directory errors.
std::vector<std::filesystem::path> collect_files(const RunConfig& config,
                                                 fixture::FixtureKind kind);

// Each command writes its report to `out`, user-facing errors to `err`, and
// returns the process exit code.
int list_files(const RunConfig& config, std::ostream& out, std::ostream& err);
int list_cases(const RunConfig& config, std::ostream& out, std::ostream& err);
int show_case(const RunConfig& config, const ShowRequest& request, std::ostream& out,
              std::ostream& err);

// Decodes every selected fixture without running anything. Exit 1 when any
// file fails to read or decode, or a .dat file has malformed cases.
int run_smoke(const RunConfig& config, std::ostream& out, std::ostream& err);

// Runs every selected suite through the engine and writes the report.
int run_suites(const RunConfig& config, const html::ParserFactory& make_parser,
               core::DiagnosticEmitter& diagnostics, std::ostream& out, std::ostream& err);

// Dispatches on the flags in `config`: show, smoke, list, list-cases, run.
int run_command(const RunConfig& config, const html::ParserFactory& make_parser,
                core::DiagnosticEmitter& diagnostics, std::ostream& out, std::ostream& err);

} // namespace conform::runner
