#include <conform/core/config.h>
#include <conform/core/diagnostics.h>
#include <conform/html/parser.h>
#include <conform/runner/commands.h>
#include <conform/runner/run_config.h>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(std::ostream& stream) {
  stream << conform::runner::usage_text();
}

bool is_help_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-h" || text == "--help";
}

bool is_version_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-V" || text == "--version";
}

}  // namespace

int main(int argc, char** argv) {
  namespace config = conform::core::config;

  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return config::kExitSuccess;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << config::kVersionString << "\n";
    return config::kExitSuccess;
  }

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int index = 1; index < argc; ++index) {
    args.emplace_back(argv[index] != nullptr ? argv[index] : "");
  }

  std::string error;
  const auto run_config = conform::runner::parse_arguments(args, error);
  if (!run_config) {
    std::cerr << error << "\n";
    print_usage(std::cerr);
    return config::kExitUsage;
  }

  conform::core::DiagnosticEmitter diagnostics;
  diagnostics.set_threshold(run_config->verbose ? conform::core::Severity::Info
                                                : conform::core::Severity::Warning);
  diagnostics.add_observer([](const conform::core::DiagnosticEvent& event) {
    std::cerr << conform::core::format_diagnostic(event) << "\n";
  });

  return conform::runner::run_command(*run_config, conform::html::placeholder_parser_factory(),
                                      diagnostics, std::cout, std::cerr);
}
