#include <conform/runner/summary.h>

#include <cstddef>
#include <utility>

namespace conform::runner {

void Summary::record_pass() {
    ++total;
    ++passed;
}

void Summary::record_failure(Failure failure, size_t cap) {
    ++total;
    ++failed;
    if (failures.size() < cap) {
        failures.push_back(std::move(failure));
    }
}

void Summary::merge(Summary other, size_t cap) {
    total += other.total;
    passed += other.passed;
    failed += other.failed;

    if (failures.size() > cap) {
        failures.erase(failures.begin() + static_cast<std::ptrdiff_t>(cap), failures.end());
    }
    for (auto& f : other.failures) {
        if (failures.size() >= cap) break;
        failures.push_back(std::move(f));
    }
}

} // namespace conform::runner
