#pragma once
#include <conform/fixture/discovery.h>
#include <conform/runner/summary.h>

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace conform::runner {

struct SuiteOutcome {
    fixture::FixtureKind kind = fixture::FixtureKind::TreeConstruction;
    Summary summary;
};

// "<suite>: <passed>/<total> passed (<failed> failed)"
std::string format_summary_line(fixture::FixtureKind kind, const Summary& summary);

// "- <file> case=<i> mode=<label>"
std::string format_failure_line(const Failure& failure);

// Suite lines in order, then the combined failure list truncated to `cap`.
// With `verbose`, each failure is followed by its input, expected and actual
// text.
void write_report(std::ostream& out, const std::vector<SuiteOutcome>& outcomes, size_t cap,
                  bool verbose);

bool any_failed(const std::vector<SuiteOutcome>& outcomes);

} // namespace conform::runner
