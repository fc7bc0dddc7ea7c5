#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Prints "  FAIL: ..." and leaves the bool test function, as the navigate tests do by hand
#define CHECK(condition)                                                         \
    do {                                                                         \
        if (!(condition)) {                                                      \
            std::cout << "  FAIL: " << __FILE__ << ":" << __LINE__ << ": "       \
                      << #condition << std::endl;                                \
            return false;                                                        \
        }                                                                        \
    } while (0)

namespace test_support {

using TestCase = std::pair<std::string, std::function<bool()>>;

inline int run_tests(const std::string& suite, const std::vector<TestCase>& tests) {
    std::cout << "Running " << suite << " tests...\n";

    int failed = 0;
    for (const auto& [name, test] : tests) {
        bool passed = false;
        try {
            passed = test();
        } catch (const std::exception& e) {
            std::cout << "  FAIL: unexpected exception: " << e.what() << std::endl;
        }

        if (passed) {
            std::cout << "✓ " << name << "\n";
        } else {
            std::cout << "✗ " << name << "\n";
            failed++;
        }
    }

    if (failed == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    }
    std::cout << "\n" << failed << " of " << tests.size() << " tests failed\n";
    return 1;
}

} // namespace test_support
