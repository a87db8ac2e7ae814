#include <conform/runner/run_config.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <thread>

namespace conform::runner {

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_count(std::string_view text, size_t& value) {
    if (text.empty()) {
        return false;
    }

    size_t parsed = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (result.ec != std::errc() || result.ptr != end) {
        return false;
    }

    value = parsed;
    return true;
}

std::optional<fixture::FixtureKind> parse_suite_name(std::string_view name) {
    if (name == "tree") return fixture::FixtureKind::TreeConstruction;
    if (name == "tokenizer") return fixture::FixtureKind::Tokenizer;
    if (name == "serializer") return fixture::FixtureKind::Serializer;
    return std::nullopt;
}

size_t default_thread_count() {
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

} // namespace

std::vector<fixture::FixtureKind> RunConfig::suites() const {
    std::vector<fixture::FixtureKind> kinds;
    if (run_tree) kinds.push_back(fixture::FixtureKind::TreeConstruction);
    if (run_tokenizer) kinds.push_back(fixture::FixtureKind::Tokenizer);
    if (run_serializer) kinds.push_back(fixture::FixtureKind::Serializer);
    return kinds;
}

std::filesystem::path expand_home(std::string_view path) {
    if (starts_with(path, "~/")) {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / std::string(path.substr(2));
        }
    }
    return std::filesystem::path(std::string(path));
}

std::string usage_text() {
    return std::string("usage: ") + core::config::kProgramName +
           " [--tests PATH] [--tree|--tokenizer|--serializer|--all]"
           " [--list] [--list-cases] [--show tree|tokenizer|serializer FILE INDEX]"
           " [--smoke] [--threads N] [--max-failures N] [--fail-fast]"
           " [--filter SUBSTR] [--verbose]\n";
}

std::optional<RunConfig> parse_arguments(const std::vector<std::string_view>& args,
                                         std::string& error) {
    RunConfig config;
    config.tests_root = expand_home(core::config::kDefaultTestsRoot);
    config.threads = default_thread_count();

    auto need_value = [&](size_t& index, std::string_view flag,
                          const char* what) -> std::optional<std::string_view> {
        if (index + 1 >= args.size()) {
            error = std::string(flag) + " needs " + what;
            return std::nullopt;
        }
        return args[++index];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "--tests") {
            auto value = need_value(i, arg, "a path");
            if (!value) return std::nullopt;
            config.tests_root = expand_home(*value);
        } else if (arg == "--tree") {
            config.run_tree = true;
        } else if (arg == "--tokenizer") {
            config.run_tokenizer = true;
        } else if (arg == "--serializer") {
            config.run_serializer = true;
        } else if (arg == "--all") {
            config.run_tree = true;
            config.run_tokenizer = true;
            config.run_serializer = true;
        } else if (arg == "--list") {
            config.list_only = true;
        } else if (arg == "--list-cases") {
            config.list_cases = true;
        } else if (arg == "--show") {
            auto suite = need_value(i, arg, "a suite (tree|tokenizer|serializer)");
            if (!suite) return std::nullopt;
            auto file = need_value(i, arg, "a file path");
            if (!file) return std::nullopt;
            auto index = need_value(i, arg, "a case index");
            if (!index) return std::nullopt;

            auto kind = parse_suite_name(*suite);
            if (!kind) {
                error = "--show suite must be tree|tokenizer|serializer";
                return std::nullopt;
            }
            ShowRequest show;
            show.suite = *kind;
            show.file = std::filesystem::path(std::string(*file));
            if (!parse_count(*index, show.case_index)) {
                error = "invalid --show case index";
                return std::nullopt;
            }
            config.show = show;
        } else if (arg == "--smoke") {
            config.smoke = true;
        } else if (arg == "--threads") {
            auto value = need_value(i, arg, "a number");
            if (!value) return std::nullopt;
            if (!parse_count(*value, config.threads)) {
                error = "invalid --threads";
                return std::nullopt;
            }
        } else if (arg == "--max-failures") {
            auto value = need_value(i, arg, "a number");
            if (!value) return std::nullopt;
            if (!parse_count(*value, config.max_failures)) {
                error = "invalid --max-failures";
                return std::nullopt;
            }
        } else if (arg == "--fail-fast") {
            config.fail_fast = true;
        } else if (arg == "--filter") {
            auto value = need_value(i, arg, "a string");
            if (!value) return std::nullopt;
            config.filter = std::string(*value);
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            error = "unknown arg: " + std::string(arg);
            return std::nullopt;
        }
    }

    if (!config.run_tree && !config.run_tokenizer && !config.run_serializer) {
        config.run_tree = true;
    }
    config.threads = std::max<size_t>(config.threads, 1);
    config.max_failures = std::max<size_t>(config.max_failures, 1);
    return config;
}

} // namespace conform::runner
