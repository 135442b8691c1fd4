//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include "eurofolio/core/logger.hpp"

namespace eurofolio {
namespace testing {

/**
 * Fixture that gives every test a console logger showing errors only,
 * and leaves the singleton uninitialized afterwards.
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace eurofolio
