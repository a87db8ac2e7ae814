#pragma once
#include <conform/core/config.h>
#include <conform/fixture/discovery.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::runner {

struct ShowRequest {
    fixture::FixtureKind suite = fixture::FixtureKind::TreeConstruction;
    std::filesystem::path file;  // absolute, or relative to the tests root
    size_t case_index = 0;
};

struct RunConfig {
    std::filesystem::path tests_root;
    bool run_tree = false;
    bool run_tokenizer = false;
    bool run_serializer = false;
    bool list_only = false;
    bool list_cases = false;
    std::optional<ShowRequest> show;
    bool smoke = false;
    size_t threads = 1;
    size_t max_failures = core::config::kDefaultMaxFailures;
    bool fail_fast = false;
    std::optional<std::string> filter;
    bool verbose = false;

    // Selected suites in reporting order.
    std::vector<fixture::FixtureKind> suites() const;
};

// "~/x" becomes "$HOME/x" when HOME is set; anything else is unchanged.
std::filesystem::path expand_home(std::string_view path);

// Parses everything after the program name. Help and version flags are
// handled by the caller. Returns std::nullopt with `error` set on bad input.
std::optional<RunConfig> parse_arguments(const std::vector<std::string_view>& args,
                                         std::string& error);

std::string usage_text();

} // namespace conform::runner
