/**
 * @file test_macros.hpp
 * @brief Assertion macros and runner shared by the test executables
 */

#ifndef MIRROR_TEST_MACROS_HPP
#define MIRROR_TEST_MACROS_HPP

#include <cmath>
#include <exception>
#include <iostream>

// Test helper macros
#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAILED: " << msg << std::endl; \
            return false; \
        } \
    } while(0)

#define TEST_ASSERT_NEAR(a, b, tol, msg) \
    do { \
        if (std::abs((a) - (b)) > (tol)) { \
            std::cerr << "FAILED: " << msg << " (" << (a) << " vs " << (b) << ")" << std::endl; \
            return false; \
        } \
    } while(0)

#define TEST_ASSERT_THROWS(stmt, exc, msg) \
    do { \
        bool thrown_ = false; \
        try { \
            stmt; \
        } catch (const exc&) { \
            thrown_ = true; \
        } \
        if (!thrown_) { \
            std::cerr << "FAILED: " << msg << " (expected " #exc ")" << std::endl; \
            return false; \
        } \
    } while(0)

/**
 * @brief Counts passed and failed tests; exceptions count as failures
 */
struct TestRunner {
    int passed = 0;
    int failed = 0;

    void run(bool (*test_fn)()) {
        try {
            if (test_fn()) {
                passed++;
            } else {
                failed++;
            }
        } catch (const std::exception& e) {
            std::cerr << "EXCEPTION: " << e.what() << std::endl;
            failed++;
        }
    }

    int report() const {
        std::cout << "========================================" << std::endl;
        std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
        std::cout << "========================================" << std::endl;
        return (failed == 0) ? 0 : 1;
    }
};

#endif // MIRROR_TEST_MACROS_HPP
