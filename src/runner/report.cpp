#include <conform/runner/report.h>
#include <conform/core/text.h>

namespace conform::runner {

namespace {

void write_block(std::ostream& out, const char* title, const std::string& text) {
    out << "    " << title << ":\n";
    for (std::string_view line : core::split_lines(text)) {
        out << "      " << line << "\n";
    }
}

} // namespace

std::string format_summary_line(fixture::FixtureKind kind, const Summary& summary) {
    return std::string(fixture::kind_name(kind)) + ": " + std::to_string(summary.passed) + "/" +
           std::to_string(summary.total) + " passed (" + std::to_string(summary.failed) +
           " failed)";
}

std::string format_failure_line(const Failure& failure) {
    return "- " + failure.file.generic_string() + " case=" +
           std::to_string(failure.case_index) + " mode=" + failure.label;
}

void write_report(std::ostream& out, const std::vector<SuiteOutcome>& outcomes, size_t cap,
                  bool verbose) {
    std::vector<const Failure*> shown;
    for (const auto& outcome : outcomes) {
        out << format_summary_line(outcome.kind, outcome.summary) << "\n";
        for (const auto& failure : outcome.summary.failures) {
            if (shown.size() < cap) shown.push_back(&failure);
        }
    }

    if (shown.empty()) return;

    out << "failures (showing up to " << cap << "):\n";
    for (const Failure* failure : shown) {
        out << format_failure_line(*failure) << "\n";
        if (verbose) {
            write_block(out, "input", failure->input);
            write_block(out, "expected", failure->expected);
            write_block(out, "actual", failure->actual);
        }
    }
}

bool any_failed(const std::vector<SuiteOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        if (outcome.summary.failed > 0) return true;
    }
    return false;
}

} // namespace conform::runner
