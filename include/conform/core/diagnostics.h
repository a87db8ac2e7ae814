#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// A line inside a fixture file, relative to the tests root.
struct FixtureLocation {
    std::filesystem::path file;
    size_t line = 0;
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string component;  // "fixture", "runner", ...
    std::string suite;      // suite kind name, or a command name
    std::optional<FixtureLocation> location;
    std::string message;
    size_t chunk = 0;       // 1-based worker chunk, 0 when raised by the dispatcher
};

// "[warning] fixture/tree-construction tree-construction/a.dat:12 (chunk 2): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects events for one thread of work. Not thread-safe: every worker
// records into an emitter of its own and the dispatcher folds the drained
// events back in with replay().
class DiagnosticEmitter {
public:
    void emit(Severity severity, std::string component, std::string suite, std::string message);
    void emit_at(Severity severity, std::string component, std::string suite,
                 FixtureLocation location, std::string message);

    // Records events drained from a worker emitter, stamping each with
    // `chunk`. Original timestamps are kept.
    void replay(std::vector<DiagnosticEvent> events, size_t chunk);

    // Hands over everything recorded so far and leaves the emitter empty.
    std::vector<DiagnosticEvent> drain();

    // Events below the threshold are dropped before observers see them.
    void set_threshold(Severity threshold) { threshold_ = threshold; }
    Severity threshold() const { return threshold_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    size_t count(Severity severity) const;
    std::vector<DiagnosticEvent> by_component(std::string_view component) const;

private:
    void record(DiagnosticEvent event);

    Severity threshold_ = Severity::Info;
    std::vector<DiagnosticObserver> observers_;
    std::vector<DiagnosticEvent> events_;
};

}  // namespace conform::core
