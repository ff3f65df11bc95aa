/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger initialization
 */

#include <gtest/gtest.h>
#include "logger.h"

using iot::common::ConfigManager;
using iot::common::Logger;

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
}

TEST(LoggerTest, InitializeInstallsDefaultLogger) {
    Logger::initialize("entity-core-test", "debug");

    EXPECT_EQ(spdlog::default_logger()->name(), "entity-core-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
}

TEST(LoggerTest, InitializeFromConfig) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::LOG_LEVEL, "error");

    Logger::initializeFromConfig("entity-core-config-test");
    EXPECT_EQ(spdlog::default_logger()->name(), "entity-core-config-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    config.unset(ConfigManager::LOG_LEVEL);
    Logger::setLevel("info");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
}
