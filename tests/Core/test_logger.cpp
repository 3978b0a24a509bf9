/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger infrastructure
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <gtest/gtest.h>
#include "Vigil/Core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include <vector>

using namespace Vigil::Core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testLogPath_ = "/tmp/vigil_test_logger.log";
        Logger::Instance().Shutdown();
        if (std::filesystem::exists(testLogPath_)) {
            std::filesystem::remove(testLogPath_);
        }
    }

    void TearDown() override {
        Logger::Instance().Shutdown();
        Logger::Instance().SetCallback(nullptr);

        if (std::filesystem::exists(testLogPath_)) {
            std::filesystem::remove(testLogPath_);
        }

        // Rotated files
        for (const auto& entry : std::filesystem::directory_iterator("/tmp")) {
            if (entry.path().filename().string().find("vigil_test_logger.") == 0) {
                std::filesystem::remove(entry.path());
            }
        }
    }

    std::string readLog() const {
        std::ifstream logFile(testLogPath_);
        return std::string((std::istreambuf_iterator<char>(logFile)),
                           std::istreambuf_iterator<char>());
    }

    std::string testLogPath_;
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_TRUE(logger.IsInitialized());
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));

    logger.Shutdown();
    EXPECT_FALSE(logger.IsInitialized());
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Critical));
}

TEST_F(LoggerTest, SecondInitializeIsRejected) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Info, LogOutput::Console));
    EXPECT_FALSE(logger.Initialize(LogLevel::Trace, LogOutput::Console));
    EXPECT_EQ(logger.GetMinLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Warning, LogOutput::Console);

    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Trace));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Critical));

    logger.SetMinLevel(LogLevel::Debug);
    EXPECT_TRUE(logger.IsLevelEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.IsLevelEnabled(LogLevel::Trace));
}

TEST_F(LoggerTest, FileOutput) {
    auto& logger = Logger::Instance();

    EXPECT_TRUE(logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_));

    logger.Log(LogLevel::Info, "Test message 1");
    logger.Log(LogLevel::Error, "Test message 2");
    logger.Flush();

    EXPECT_TRUE(std::filesystem::exists(testLogPath_));

    std::string content = readLog();
    EXPECT_NE(content.find("Test message 1"), std::string::npos);
    EXPECT_NE(content.find("Test message 2"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, FormattedLogging) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    logger.LogFormat(LogLevel::Info, "Test %s with number %d", "message", 42);
    logger.Flush();

    EXPECT_NE(readLog().find("Test message with number 42"), std::string::npos);
}

TEST_F(LoggerTest, Statistics) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Trace, LogOutput::Console);
    logger.ResetStatistics();

    logger.Log(LogLevel::Trace, "Trace message");
    logger.Log(LogLevel::Debug, "Debug message");
    logger.Log(LogLevel::Info, "Info message");
    logger.Log(LogLevel::Warning, "Warning message");
    logger.Log(LogLevel::Error, "Error message");
    logger.Log(LogLevel::Critical, "Critical message");

    auto stats = logger.GetStatistics();

    EXPECT_EQ(stats.trace, 1u);
    EXPECT_EQ(stats.debug, 1u);
    EXPECT_EQ(stats.info, 1u);
    EXPECT_EQ(stats.warning, 1u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);
    EXPECT_EQ(stats.dropped, 0u);
}

TEST_F(LoggerTest, DroppedMessages) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Error, LogOutput::Console);
    logger.ResetStatistics();

    logger.Log(LogLevel::Trace, "Trace message");
    logger.Log(LogLevel::Debug, "Debug message");
    logger.Log(LogLevel::Info, "Info message");
    logger.Log(LogLevel::Warning, "Warning message");

    logger.Log(LogLevel::Error, "Error message");
    logger.Log(LogLevel::Critical, "Critical message");

    auto stats = logger.GetStatistics();

    EXPECT_EQ(stats.dropped, 4u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);
}

TEST_F(LoggerTest, MessagesBeforeInitializeAreDropped) {
    auto& logger = Logger::Instance();
    logger.ResetStatistics();

    logger.Log(LogLevel::Critical, "Nobody is listening");

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.critical, 0u);
}

TEST_F(LoggerTest, ThreadSafety) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);
    logger.ResetStatistics();

    const int numThreads = 10;
    const int messagesPerThread = 100;

    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&logger, i, messagesPerThread]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                logger.LogFormat(LogLevel::Info, "Thread %d message %d", i, j);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    logger.Flush();

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.info, static_cast<size_t>(numThreads * messagesPerThread));
}

TEST_F(LoggerTest, Callback) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Info, LogOutput::Callback);

    int callbackCount = 0;
    LogLevel lastLevel = LogLevel::Off;
    std::string lastMessage;

    logger.SetCallback([&](LogLevel level, std::string_view message,
                           std::chrono::system_clock::time_point) {
        callbackCount++;
        lastLevel = level;
        lastMessage = std::string(message);
    });

    logger.Log(LogLevel::Info, "Test callback message");
    logger.Log(LogLevel::Debug, "Filtered out");

    EXPECT_EQ(callbackCount, 1);
    EXPECT_EQ(lastLevel, LogLevel::Info);
    EXPECT_EQ(lastMessage, "Test callback message");
}

TEST_F(LoggerTest, Macros) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Trace, LogOutput::File, testLogPath_);
    logger.ResetStatistics();

    VIGIL_LOG_TRACE("Trace macro test");
    VIGIL_LOG_DEBUG("Debug macro test");
    VIGIL_LOG_INFO("Info macro test");
    VIGIL_LOG_WARNING("Warning macro test");
    VIGIL_LOG_ERROR("Error macro test");
    VIGIL_LOG_CRITICAL("Critical macro test");

    logger.Flush();

    auto stats = logger.GetStatistics();
    EXPECT_EQ(stats.trace, 1u);
    EXPECT_EQ(stats.debug, 1u);
    EXPECT_EQ(stats.info, 1u);
    EXPECT_EQ(stats.warning, 1u);
    EXPECT_EQ(stats.error, 1u);
    EXPECT_EQ(stats.critical, 1u);

    std::string content = readLog();
    EXPECT_NE(content.find("Trace macro test"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp"), std::string::npos);
}

TEST_F(LoggerTest, FormattedMacros) {
    auto& logger = Logger::Instance();

    logger.Initialize(LogLevel::Debug, LogOutput::File, testLogPath_);

    VIGIL_LOG_INFO_F("Formatted %s with number %d", "message", 123);
    logger.Flush();

    EXPECT_NE(readLog().find("Formatted message with number 123"), std::string::npos);
}

TEST(ParseLogLevelTest, AcceptsKnownNames) {
    LogLevel level = LogLevel::Off;

    EXPECT_TRUE(ParseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("Info", level));
    EXPECT_EQ(level, LogLevel::Info);
    EXPECT_TRUE(ParseLogLevel("warn", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(ParseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(ParseLogLevel("error", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_TRUE(ParseLogLevel("critical", level));
    EXPECT_EQ(level, LogLevel::Critical);
    EXPECT_TRUE(ParseLogLevel("off", level));
    EXPECT_EQ(level, LogLevel::Off);
}

TEST(ParseLogLevelTest, RejectsUnknownNameAndKeepsLevel) {
    LogLevel level = LogLevel::Error;

    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_FALSE(ParseLogLevel("", level));
    EXPECT_EQ(level, LogLevel::Error);
}
