#pragma once
#include <conform/core/diagnostics.h>
#include <conform/fixture/discovery.h>
#include <conform/html/parser.h>
#include <conform/runner/summary.h>

#include <cstddef>
#include <filesystem>
#include <vector>

namespace conform::runner {

struct EngineOptions {
    std::filesystem::path tests_root;
    size_t workers = 1;
    size_t max_failures = 1;
    bool fail_fast = false;
};

// Splits `files` into contiguous chunks of ceil(n / workers) files, with
// `workers` clamped to [1, n]. An empty list yields no chunks.
std::vector<std::vector<std::filesystem::path>> partition_files(
    const std::vector<std::filesystem::path>& files, size_t workers);

// What one worker hands back after draining its chunk.
struct ChunkResult {
    Summary summary;
    std::vector<core::DiagnosticEvent> events;
};

// Runs one chunk sequentially on the calling thread with a parser of its own.
// Stops early on fail-fast after a failure, or once the chunk holds
// `options.max_failures` failure records. Throws std::runtime_error when
// the factory yields no parser.
ChunkResult run_chunk(fixture::FixtureKind kind, const std::vector<std::filesystem::path>& chunk,
                      const EngineOptions& options, const html::ParserFactory& make_parser);

// Runs a whole suite across a pool with one task per chunk. Worker results
// and their diagnostics are merged in chunk order, so the failure list
// follows discovery order regardless of which worker finished first. The
// merged failure list is truncated to `options.max_failures`. An exception
// thrown by a worker is rethrown here.
Summary run_suite(fixture::FixtureKind kind, const std::vector<std::filesystem::path>& files,
                  const EngineOptions& options, const html::ParserFactory& make_parser,
                  core::DiagnosticEmitter& diagnostics);

} // namespace conform::runner
