/**
 * @file test_file_logger.cpp
 * @brief Thread-safety and content validation for file logging
 *
 * Tests:
 * 1. Automatic directory and timestamped file creation
 * 2. Component-prefixed stream logging reaches the file
 * 3. Concurrent logging from multiple threads
 * 4. Level filtering and level names
 */

#include <gtest/gtest.h>
#include <rockseg/core/Logger.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace rockseg::core;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

class FileLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = (std::filesystem::temp_directory_path() / "rockseg_test_logs" / "nested").string();
        std::filesystem::remove_all(std::filesystem::path(dir_).parent_path());

        auto& logger = Logger::getInstance();
        ASSERT_TRUE(logger.initializeWithTimestamp(dir_, LogLevel::DEBUG));
        logger.setConsoleOutput(false);
        logFile_ = logger.getCurrentLogFile();
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
        std::error_code ec;
        std::filesystem::remove_all(std::filesystem::path(dir_).parent_path(), ec);
    }

    std::string dir_;
    std::string logFile_;
};

TEST_F(FileLoggerTest, CreatesTimestampedFile) {
    ASSERT_FALSE(logFile_.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir_));
    EXPECT_TRUE(std::filesystem::exists(logFile_));
    EXPECT_NE(logFile_.find("log_rockseg_"), std::string::npos);
    EXPECT_EQ(std::filesystem::path(logFile_).extension(), ".txt");

    Logger::getInstance().flush();
    EXPECT_NE(readFile(logFile_).find("Log Level: DEBUG"), std::string::npos);
}

TEST_F(FileLoggerTest, ComponentPrefixReachesFile) {
    ROCKSEG_LOG_INFO("BasalClassifier") << "Classified " << 42 << " points";
    LOG_WARNING("[BoundaryFiller] plain message");
    Logger::getInstance().flush();

    const std::string content = readFile(logFile_);
    EXPECT_NE(content.find("[INFO] [BasalClassifier] Classified 42 points"), std::string::npos);
    EXPECT_NE(content.find("[WARNING] [BoundaryFiller] plain message"), std::string::npos);
    EXPECT_NE(content.find("test_file_logger.cpp:"), std::string::npos);
}

TEST_F(FileLoggerTest, ConcurrentLoggingKeepsEveryLine) {
    constexpr int kThreads = 10;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int m = 0; m < kMessagesPerThread; ++m) {
                ROCKSEG_LOG_DEBUG("Worker") << "thread " << t << " message " << m;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    Logger::getInstance().flush();

    const std::string content = readFile(logFile_);
    EXPECT_EQ(countOccurrences(content, "[Worker] thread "), static_cast<size_t>(kThreads * kMessagesPerThread));
    EXPECT_NE(content.find("[Worker] thread 9 message 99"), std::string::npos);
}

TEST_F(FileLoggerTest, MessagesBelowLevelAreDropped) {
    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    LOG_INFO("[Filter] dropped info");
    LOG_DEBUG("[Filter] dropped debug");
    LOG_ERROR("[Filter] kept error");
    logger.flush();

    const std::string content = readFile(logFile_);
    EXPECT_EQ(content.find("dropped"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [Filter] kept error"), std::string::npos);
}

TEST(LogLevelTest, ParseNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parseLogLevel("Critical", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_EQ(logLevelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::ERROR), "ERROR");
}
