/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <lumen/utils/logger.hpp>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lumen::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setSink([this](LogLevel level, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            levels_.push_back(level);
            lines_.push_back(line);
        });
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    std::vector<LogLevel> levels() {
        std::lock_guard<std::mutex> lock(mutex_);
        return levels_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
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
    LOG_WARN("Test", "shown");
    LOG_ERROR("Test", "shown");

    auto captured = levels();
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], LogLevel::WARN);
    EXPECT_EQ(captured[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, OffSuppressesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(lines().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, PlaceholderFormatting) {
    LOG_INFO("Format", "device {} at {}:{}", "AA:BB", "10.0.0.2", 38899);

    auto captured = lines();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find("device AA:BB at 10.0.0.2:38899"), std::string::npos);
}

TEST_F(LoggerTest, ExtraArgumentsAreIgnored) {
    LOG_INFO("Format", "no placeholders", 1, 2);

    auto captured = lines();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find("no placeholders"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTagAndLevelInLine) {
    LOG_WARN("MyComponent", "Test message");

    auto captured = lines();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find("[WARN ]"), std::string::npos);
    EXPECT_NE(captured[0].find("[MyComponent] Test message"), std::string::npos);
    EXPECT_EQ(captured[0].find('\033'), std::string::npos);
}

TEST_F(LoggerTest, ConditionalLogging) {
    LOG_IF(LogLevel::INFO, "Cond", false, "skipped");
    LOG_IF(LogLevel::INFO, "Cond", true, "kept");

    auto captured = lines();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find("kept"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            std::string component = "Thread" + std::to_string(i);
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO(component.c_str(), "Message {}", j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(lines().size(), static_cast<size_t>(num_threads * logs_per_thread));
}
