#include <conform/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <utility>

namespace conform::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << event.component;
    if (!event.suite.empty()) {
        oss << "/" << event.suite;
    }
    if (event.location) {
        oss << " " << event.location->file.generic_string();
        if (event.location->line != 0) {
            oss << ":" << event.location->line;
        }
    }
    if (event.chunk != 0) {
        oss << " (chunk " << event.chunk << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, std::string component, std::string suite,
                             std::string message) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.component = std::move(component);
    event.suite = std::move(suite);
    event.message = std::move(message);
    record(std::move(event));
}

void DiagnosticEmitter::emit_at(Severity severity, std::string component, std::string suite,
                                FixtureLocation location, std::string message) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.component = std::move(component);
    event.suite = std::move(suite);
    event.location = std::move(location);
    event.message = std::move(message);
    record(std::move(event));
}

void DiagnosticEmitter::replay(std::vector<DiagnosticEvent> events, size_t chunk) {
    for (auto& event : events) {
        event.chunk = chunk;
        record(std::move(event));
    }
}

std::vector<DiagnosticEvent> DiagnosticEmitter::drain() {
    std::vector<DiagnosticEvent> drained;
    drained.swap(events_);
    return drained;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
        [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::by_component(std::string_view component) const {
    std::vector<DiagnosticEvent> matched;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matched),
        [component](const DiagnosticEvent& e) { return e.component == component; });
    return matched;
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    if (event.severity < threshold_) return;

    events_.push_back(std::move(event));
    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

}  // namespace conform::core
