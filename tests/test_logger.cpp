/*
 * swell - Wave Scheduler & Process Watchdog
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swell/logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace swell;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setSink([this](LogLevel level, const std::string& line) {
            levels.push_back(level);
            lines.push_back(line);
        });
    }
    void TearDown() override {
        Logger::setSink({});
        ::unsetenv("SWELL_LOG_LEVEL");
        Logger::setLevel(LogLevel::INFO);
    }

    std::vector<LogLevel> levels;
    std::vector<std::string> lines;
};

}

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::setLevel(LogLevel::WARN);
    LOG_ERROR("broken");
    LOG_WARN("careful");
    LOG_INFO("chatty");
    LOG_DEBUG("noisy");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(levels[0], LogLevel::ERROR);
    EXPECT_NE(lines[0].find("[ERROR]"), std::string::npos);
    EXPECT_NE(lines[0].find("broken"), std::string::npos);
    EXPECT_NE(lines[1].find("[WARN ]"), std::string::npos);
}

TEST_F(LoggerTest, TagsNamedThreads) {
    Logger::setLevel(LogLevel::INFO);
    std::thread worker([]() {
        setThreadName("Watchdog");
        LOG_INFO("sweeping");
    });
    worker.join();

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[Watchdog] sweeping"), std::string::npos);
}

TEST_F(LoggerTest, LevelComesFromEnvironment) {
    ::setenv("SWELL_LOG_LEVEL", "debug", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::DEBUG);

    ::setenv("SWELL_LOG_LEVEL", "nonsense", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::INFO);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(Logger::parseLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::TRACE);
    EXPECT_FALSE(Logger::parseLevel("loud").has_value());
}
