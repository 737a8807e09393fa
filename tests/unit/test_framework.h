#pragma once

#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mepg/core/types.h"
#include "mepg/electrical/constraint_validator.h"
#include "mepg/graph/graph.h"

/**
 * @brief Registers named test functions and runs them, optionally filtered
 *
 * A test fails when it throws; the assertion macros below throw
 * std::runtime_error with the failed expression.
 */
class TestRunner {
  public:
    void add_test(std::string const& name, std::function<void()> test_func) {
        tests_.push_back({name, std::move(test_func)});
    }

    /**
     * @brief Only run tests whose name contains this text
     */
    void set_filter(std::string filter) { filter_ = std::move(filter); }

    void run_all() {
        std::cout << "Running " << tests_.size() << " tests";
        if (!filter_.empty()) std::cout << " matching \"" << filter_ << "\"";
        std::cout << "...\n" << std::endl;

        for (auto const& test : tests_) {
            if (!filter_.empty() && test.name.find(filter_) == std::string::npos) {
                ++skipped_;
                continue;
            }

            std::cout << "Running " << test.name << "... ";
            auto const start = std::chrono::steady_clock::now();
            try {
                test.test_func();
                auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                std::cout << "PASSED (" << elapsed.count() << " ms)" << std::endl;
                ++passed_;
            } catch (std::exception const& e) {
                std::cout << "FAILED: " << e.what() << std::endl;
                failed_names_.push_back(test.name);
            } catch (...) {
                std::cout << "FAILED: Unknown exception" << std::endl;
                failed_names_.push_back(test.name);
            }
        }

        std::cout << "\nTest Results:" << std::endl;
        std::cout << "  Passed:  " << passed_ << std::endl;
        std::cout << "  Failed:  " << failed_names_.size() << std::endl;
        std::cout << "  Skipped: " << skipped_ << std::endl;
        for (auto const& name : failed_names_) {
            std::cout << "    - " << name << std::endl;
        }
    }

    int get_failed_count() const noexcept { return static_cast<int>(failed_names_.size()); }

  private:
    struct Test {
        std::string name;
        std::function<void()> test_func;
    };

    std::vector<Test> tests_;
    std::string filter_;
    int passed_ = 0;
    int skipped_ = 0;
    std::vector<std::string> failed_names_;
};

// Test assertion macros
#define ASSERT_TRUE(condition)                                         \
    do {                                                               \
        if (!(condition)) {                                            \
            throw std::runtime_error("Assertion failed: " #condition); \
        }                                                              \
    } while (0)

#define ASSERT_FALSE(condition)                                                           \
    do {                                                                                  \
        if (condition) {                                                                  \
            throw std::runtime_error("Assertion failed: " #condition " should be false"); \
        }                                                                                 \
    } while (0)

// Helper functions for converting values to strings for assertions
template <typename T>
inline std::string assert_to_string(T const& val) {
    return std::to_string(val);
}

inline std::string assert_to_string(std::string const& val) { return "\"" + val + "\""; }

inline std::string assert_to_string(char const* val) { return std::string("\"") + val + "\""; }

inline std::string assert_to_string(mepg::NodeType const& val) {
    return mepg::node_type_to_string(val);
}

inline std::string assert_to_string(mepg::NodeSubtype const& val) {
    return mepg::node_subtype_to_string(val);
}

inline std::string assert_to_string(mepg::VoltageClass const& val) {
    return mepg::voltage_class_to_string(val);
}

inline std::string assert_to_string(mepg::LoadType const& val) {
    return mepg::load_type_to_string(val);
}

inline std::string assert_to_string(mepg::CoreStrategyKind const& val) {
    return mepg::core_strategy_to_string(val);
}

inline std::string assert_to_string(mepg::OutputFormat const& val) {
    return mepg::output_format_to_string(val);
}

inline std::string assert_to_string(mepg::graph::NodeState const& val) {
    return val == mepg::graph::NodeState::ENERGIZED ? "energized" : "provisional";
}

inline std::string assert_to_string(mepg::electrical::Severity const& val) {
    return mepg::electrical::severity_to_string(val);
}

#define ASSERT_EQ(expected, actual)                                                               \
    do {                                                                                          \
        if ((expected) != (actual)) {                                                             \
            throw std::runtime_error("Assertion failed: expected " + assert_to_string(expected) + \
                                     " but got " + assert_to_string(actual));                     \
        }                                                                                         \
    } while (0)

#define ASSERT_NEAR(expected, actual, tolerance)                                                \
    do {                                                                                        \
        if (std::abs((expected) - (actual)) > (tolerance)) {                                    \
            throw std::runtime_error("Assertion failed: expected " + std::to_string(expected) + \
                                     " but got " + std::to_string(actual) +                     \
                                     " (tolerance: " + std::to_string(tolerance) + ")");        \
        }                                                                                       \
    } while (0)

#define ASSERT_THROWS(statement, exception_type)                                          \
    do {                                                                                  \
        bool thrown = false;                                                              \
        try {                                                                             \
            statement;                                                                    \
        } catch (exception_type const&) {                                                 \
            thrown = true;                                                                \
        }                                                                                 \
        if (!thrown) {                                                                    \
            throw std::runtime_error("Assertion failed: " #statement " did not throw " \
                                     #exception_type);                                    \
        }                                                                                 \
    } while (0)
