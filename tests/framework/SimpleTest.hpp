#pragma once

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <stdexcept>
#include <chrono>
#include <cmath>

namespace halcyon::test {

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner instance;
        return instance;
    }

    void register_test(const std::string& name, std::function<void()> test_func) {
        tests_.push_back({name, test_func});
    }

    // Optional argument: run only tests whose name contains it
    int run_all(int argc = 0, char** argv = nullptr) {
        std::string filter = (argc > 1 && argv) ? argv[1] : "";
        int passed = 0;
        int failed = 0;
        int skipped = 0;

        std::cout << "\n=== HALCYON TEST SUITE ===\n" << std::endl;

        for (const auto& test : tests_) {
            if (!filter.empty() && test.name.find(filter) == std::string::npos) {
                skipped++;
                continue;
            }
            auto start = std::chrono::steady_clock::now();
            try {
                test.func();
                std::cout << "[PASS] " << test.name << elapsed_since(start) << std::endl;
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[FAIL] " << test.name << " - " << e.what() << std::endl;
                failed++;
            } catch (...) {
                std::cout << "[FAIL] " << test.name << " - Unknown exception" << std::endl;
                failed++;
            }
        }

        std::cout << "\nResults: " << passed << " Passed, " << failed << " Failed";
        if (skipped > 0) std::cout << ", " << skipped << " Filtered";
        std::cout << "." << std::endl;
        return failed > 0 ? 1 : 0;
    }

private:
    static std::string elapsed_since(std::chrono::steady_clock::time_point start) {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
        return us >= 1000 ? " (" + std::to_string(us / 1000) + "ms)" : "";
    }

    struct TestEntry {
        std::string name;
        std::function<void()> func;
    };
    std::vector<TestEntry> tests_;
};

struct Registrar {
    Registrar(const std::string& name, std::function<void()> func) {
        TestRunner::instance().register_test(name, func);
    }
};

class AssertionFailure : public std::runtime_error {
public:
    AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

inline std::string where(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line);
}

} // namespace halcyon::test

#define TEST_CASE(name) \
    void name(); \
    static halcyon::test::Registrar reg_##name(#name, name); \
    void name()

#define ASSERT_TRUE(condition) \
    if (!(condition)) throw halcyon::test::AssertionFailure("Assertion failed: " #condition " at " + halcyon::test::where(__FILE__, __LINE__))

#define ASSERT_FALSE(condition) \
    if (condition) throw halcyon::test::AssertionFailure("Assertion failed: " #condition " is true at " + halcyon::test::where(__FILE__, __LINE__))

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw halcyon::test::AssertionFailure("Assertion failed: " #a " == " #b " at " + halcyon::test::where(__FILE__, __LINE__))

#define ASSERT_NEAR(a, b, epsilon) \
    if (std::abs((a) - (b)) > epsilon) throw halcyon::test::AssertionFailure("Assertion failed: " #a " near " #b " at " + halcyon::test::where(__FILE__, __LINE__))

#define ASSERT_NE(a, b) \
    if ((a) == (b)) throw halcyon::test::AssertionFailure("Assertion failed: " #a " != " #b " at " + halcyon::test::where(__FILE__, __LINE__))

// Passes only if `statement` throws `exception_type`
#define ASSERT_THROWS(statement, exception_type) \
    do { \
        bool caught_ = false; \
        try { statement; } catch (const exception_type&) { caught_ = true; } \
        if (!caught_) throw halcyon::test::AssertionFailure("Expected " #exception_type " from " #statement " at " + halcyon::test::where(__FILE__, __LINE__)); \
    } while (0)
