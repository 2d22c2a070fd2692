/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace Crimson {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for the combat core tests
 *
 * Sets up logging once for the whole run and keeps the global
 * configuration empty so every test starts from built-in defaults.
 */
class CrimsonTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Crimson Combat Test Suite Starting ===" << std::endl;

        // Errors from rejected invariants are expected in several tests
        Logger::Initialize("", true);
        Logger::SetLevel(spdlog::level::critical);

        Config::Instance().Clear();
    }

    void TearDown() override {
        std::cout << "=== Crimson Combat Test Suite Complete ===" << std::endl;
        Config::Instance().Clear();
        Logger::Shutdown();
    }
};

// =============================================================================
// Test Event Listener for Enhanced Output
// =============================================================================

/**
 * @brief Custom test event listener for better test output
 */
class CrimsonTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        if (test_info.result()->Failed()) {
            std::cout << "[  FAILED  ] " << test_info.test_suite_name() << "."
                      << test_info.name() << std::endl;
        }
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        std::cout << "Suite " << test_suite.name() << ": "
                  << test_suite.successful_test_count() << " passed, "
                  << test_suite.failed_test_count() << " failed" << std::endl;
    }
};

} // namespace Test
} // namespace Crimson

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Crimson::Test::CrimsonTestEnvironment());

    if (std::getenv("CRIMSON_TEST_VERBOSE") != nullptr) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        listeners.Append(new Crimson::Test::CrimsonTestListener());
    }

    return RUN_ALL_TESTS();
}
