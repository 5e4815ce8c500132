// =============================================================================
// TestHarness.hpp - Minimal self-checking test runner
// =============================================================================
// Each *_test.cpp derives from TestSuite, runs its checks from run(), and
// returns finish() from main(): 0 when everything passed, 1 otherwise.
// =============================================================================
#pragma once

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace Integra {

class TestSuite {
public:
    explicit TestSuite(std::string title) : title_(std::move(title)) {}
    virtual ~TestSuite() = default;

    virtual void run() = 0;

    int finish() {
        print_summary();
        return tests_failed_ == 0 ? 0 : 1;
    }

protected:
    void section(const char* name) {
        std::cout << "\nTesting " << name << "...\n";
    }

    void test_pass(const std::string& name) {
        std::cout << "  ✓ " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const std::string& name, const std::string& reason) {
        std::cout << "  ✗ " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const std::string& name, const std::string& reason = "condition false") {
        if (ok) test_pass(name);
        else    test_fail(name, reason);
    }

    template <typename A, typename B>
    void check_eq(const A& actual, const B& expected, const std::string& name) {
        if (actual == expected) {
            test_pass(name);
        } else {
            std::ostringstream ss;
            ss << "got " << actual << ", expected " << expected;
            test_fail(name, ss.str());
        }
    }

private:
    void print_summary() {
        std::cout << "\n╔══════════════════════════════════════════════════════════════════╗\n";
        std::cout << "║  " << std::left << std::setw(64) << title_ << "║\n";
        std::cout << "╠══════════════════════════════════════════════════════════════════╣\n";
        std::cout << "║  Passed: " << std::setw(56) << tests_passed_ << "║\n";
        std::cout << "║  Failed: " << std::setw(56) << tests_failed_ << "║\n";
        std::cout << "╚══════════════════════════════════════════════════════════════════╝\n";

        if (tests_failed_ == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n\n";
        } else {
            std::cout << "\n✗ SOME TESTS FAILED\n\n";
        }
    }

    std::string title_;
    int tests_passed_ = 0;
    int tests_failed_ = 0;
};

} // namespace Integra
