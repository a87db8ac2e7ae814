#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace conform::runner {

struct Failure {
    std::filesystem::path file;  // relative to the tests root
    size_t case_index = 0;
    std::string label;           // execution variant: "on", "off" or "n/a"
    std::string input;
    std::string expected;
    std::string actual;
};

struct Summary {
    size_t total = 0;
    size_t passed = 0;
    size_t failed = 0;
    std::vector<Failure> failures;  // never longer than the cap it was built with

    void record_pass();

    // Counts the failure and keeps its detail while fewer than `cap` are held.
    void record_failure(Failure failure, size_t cap);

    // Adds the counters and appends the other failure list, truncated to `cap`.
    void merge(Summary other, size_t cap);

    bool consistent() const { return total == passed + failed; }
};

} // namespace conform::runner
