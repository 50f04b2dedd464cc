/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <netmap/utils/logger.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace netmap::utils;
using ::testing::EndsWith;
using ::testing::HasSubstr;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setSink([this](LogLevel level, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            levels_.push_back(level);
            lines_.push_back(line);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setColorEnabled(true);
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    std::mutex mutex_;
    std::vector<LogLevel> levels_;
    std::vector<std::string> lines_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered");
    LOG_DEBUG("Test", "filtered");
    LOG_INFO("Test", "filtered");
    LOG_WARN("Test", "kept");
    LOG_ERROR("Test", "kept");

    ASSERT_EQ(lines().size(), 2u);
    EXPECT_EQ(levels_[0], LogLevel::WARN);
    EXPECT_EQ(levels_[1], LogLevel::ERROR);
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::instance().isEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(lines().empty());
}

TEST_F(LoggerTest, LineCarriesLevelComponentAndMessage) {
    LOG_INFO("SnmpProbe", "walked {} rows from {}", 42, "10.0.0.1");

    auto captured = lines();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_THAT(captured[0], HasSubstr("[INFO ]"));
    EXPECT_THAT(captured[0], HasSubstr("[SnmpProbe]"));
    EXPECT_THAT(captured[0], EndsWith("walked 42 rows from 10.0.0.1"));
    EXPECT_EQ(captured[0].front(), '[');
}

TEST_F(LoggerTest, SurplusPlaceholdersStayVerbatim) {
    LOG_INFO("Test", "only {} of {}", 1);
    LOG_INFO("Test", "no placeholders", 7);

    auto captured = lines();
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_THAT(captured[0], EndsWith("only 1 of {}"));
    EXPECT_THAT(captured[1], EndsWith("no placeholders"));
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel(""), LogLevel::INFO);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Worker", "thread {} message {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(lines().size(), static_cast<size_t>(num_threads * logs_per_thread));
}
