#include <conform/runner/engine.h>
#include <conform/platform/thread_pool.h>
#include <conform/runner/suite.h>

#include <algorithm>
#include <cstddef>
#include <future>
#include <memory>
#include <stdexcept>
#include <utility>

namespace conform::runner {

std::vector<std::vector<std::filesystem::path>> partition_files(
    const std::vector<std::filesystem::path>& files, size_t workers) {
    std::vector<std::vector<std::filesystem::path>> chunks;
    if (files.empty()) return chunks;

    workers = std::clamp<size_t>(workers, 1, files.size());
    const size_t chunk_size = (files.size() + workers - 1) / workers;

    for (size_t start = 0; start < files.size(); start += chunk_size) {
        size_t end = std::min(start + chunk_size, files.size());
        chunks.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(start),
                            files.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

ChunkResult run_chunk(fixture::FixtureKind kind, const std::vector<std::filesystem::path>& chunk,
                      const EngineOptions& options, const html::ParserFactory& make_parser) {
    ChunkResult result;
    core::DiagnosticEmitter diagnostics;
    std::unique_ptr<html::Parser> parser = make_parser();
    if (!parser) {
        throw std::runtime_error("parser factory returned no parser");
    }

    for (const auto& file : chunk) {
        FileRunOptions file_options;
        file_options.tests_root = options.tests_root;
        file_options.max_failures = options.max_failures - result.summary.failures.size();
        file_options.fail_fast = options.fail_fast;

        Summary file_summary = run_fixture_file(kind, file, *parser, file_options, diagnostics);
        result.summary.merge(std::move(file_summary), options.max_failures);

        if (options.fail_fast && result.summary.failed > 0) break;
        if (result.summary.failures.size() >= options.max_failures) break;
    }

    result.events = diagnostics.drain();
    return result;
}

Summary run_suite(fixture::FixtureKind kind, const std::vector<std::filesystem::path>& files,
                  const EngineOptions& options, const html::ParserFactory& make_parser,
                  core::DiagnosticEmitter& diagnostics) {
    Summary all;
    auto chunks = partition_files(files, options.workers);
    if (chunks.empty()) return all;

    diagnostics.emit(core::Severity::Info, "runner", fixture::kind_name(kind),
                     std::to_string(files.size()) + " files in " +
                         std::to_string(chunks.size()) + " chunks");

    std::vector<std::future<ChunkResult>> pending;
    pending.reserve(chunks.size());
    {
        platform::ThreadPool pool(chunks.size());
        for (const auto& chunk : chunks) {
            pending.push_back(pool.submit([kind, &chunk, &options, &make_parser]() {
                return run_chunk(kind, chunk, options, make_parser);
            }));
        }

        // Collected in dispatch order, not completion order.
        for (size_t i = 0; i < pending.size(); ++i) {
            ChunkResult chunk_result = pending[i].get();
            diagnostics.replay(std::move(chunk_result.events), i + 1);
            all.merge(std::move(chunk_result.summary), options.max_failures);
        }
    }
    return all;
}

} // namespace conform::runner
