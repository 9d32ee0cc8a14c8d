/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief Header-only unit testing micro-framework for SLogger.
 *
 * @details
 * ANSI-colored output, exception-protected test bodies and assertion macros that
 * record file and line. `ASSERT_THROWS` checks both that an expression throws and
 * that the exception has the expected type.
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace slogger::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.
inline int skipped_count = 0; ///< Tests that could not run in this environment.

/// @brief Thrown by assertion primitives after the failure has been reported.
struct AssertionFailure : std::runtime_error {
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

/// @brief Thrown by `SKIP_TEST` when the environment cannot exercise a test.
struct TestSkipped : std::runtime_error {
    explicit TestSkipped(const std::string& reason) : std::runtime_error(reason) {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

/**
 * @brief Validates that two generic values are equivalent.
 */
template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that two generic values are NOT equivalent.
 */
template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that a boolean expression evaluates to true.
 */
inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that a boolean expression evaluates to false.
 */
inline void assert_true_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that @p func throws an exception of type @p E.
 *
 * Any other exception, or none at all, is a failure.
 */
template <typename E, typename F>
void assert_throws(F&& func, const char* file, int line, const char* expr, const char* type)
{
    try {
        func();
    } catch (const E&) {
        return;
    } catch (const AssertionFailure&) {
        throw;
    } catch (const TestSkipped&) {
        throw;
    } catch (const std::exception& e) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw '" << e.what() << "' instead of " << type << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw " << type << std::endl;
    failed_count++;
    throw AssertionFailure();
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, std::function<void()> func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        // Clear line and print pass status
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const TestSkipped& e) {
        skipped_count++;
        std::cout << "\r\033[33m[SKIP]\033[0m " << name << " -> " << e.what() << std::endl;
    } catch (const AssertionFailure&) {
        // Counted and reported by the assertion primitive.
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        failed_count++;
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " -> unexpected exception: "
                  << e.what() << std::endl;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== SLogger Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    if (skipped_count > 0) {
        std::cout << "Skipped: \033[33m" << skipped_count << "\033[0m" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count + skipped_count) << std::endl;
}

} // namespace slogger::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) slogger::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) slogger::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

/**
 * @def ASSERT_TRUE
 * @brief Macro for truthiness assertions.
 */
#define ASSERT_TRUE(a) slogger::test::assert_true((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_FALSE
 * @brief Macro for falsiness assertions.
 */
#define ASSERT_FALSE(a) slogger::test::assert_true_false((a), __FILE__, __LINE__, #a)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) slogger::test::run(#func_name, func_name)

/**
 * @def SKIP_TEST
 * @brief Ends the current test as skipped; it counts neither as passed nor failed.
 */
#define SKIP_TEST(reason) throw slogger::test::TestSkipped(reason)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that a statement throws the given exception type (or a subclass).
 */
#define ASSERT_THROWS(stmt, type)                                                                  \
    slogger::test::assert_throws<type>([&]() { stmt; }, __FILE__, __LINE__, #stmt, #type)
