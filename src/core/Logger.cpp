#include "rockseg/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <thread>

namespace rockseg {
namespace core {

namespace {

std::string formatTime(const char* pattern, bool withMillis) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, pattern);
    if (withMillis) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
}

// Short, stable tag per thread; full ids are too long to read in a log
std::string threadTag() {
    const size_t hash = std::hash<std::thread::id>()(std::this_thread::get_id());
    std::ostringstream oss;
    oss << "T" << std::hex << std::setw(4) << std::setfill('0') << (hash & 0xffff);
    return oss.str();
}

} // namespace

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") level = LogLevel::TRACE;
    else if (lower == "debug") level = LogLevel::DEBUG;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "warning" || lower == "warn") level = LogLevel::WARNING;
    else if (lower == "error") level = LogLevel::ERROR;
    else if (lower == "critical") level = LogLevel::CRITICAL;
    else return false;
    return true;
}

std::string logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

Logger::Logger() = default;

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::openLogFile(const std::string& filename) {
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();

    logFile_.open(filename, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << filename << std::endl;
        return false;
    }
    currentLogFile_ = filename;

    logFile_ << "===========================================" << std::endl;
    logFile_ << "rockseg Pipeline Log" << std::endl;
    logFile_ << "Started: " << formatTime("%Y-%m-%d %H:%M:%S", true) << std::endl;
    logFile_ << "Log Level: " << logLevelName(minLevel_.load()) << std::endl;
    logFile_ << "===========================================" << std::endl;
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
    consoleOutput_ = true;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec || !std::filesystem::is_directory(logDirectory)) {
        std::cerr << "[Logger] Cannot use log directory " << logDirectory
                  << (ec ? ": " + ec.message() : std::string()) << ", file logging disabled" << std::endl;
        return false;
    }

    const std::filesystem::path file = std::filesystem::path(logDirectory) /
        ("log_rockseg_" + formatTime("%Y-%m-%d_%H-%M-%S", false) + ".txt");
    return openLogFile(file.string());
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << formatTime("%Y-%m-%d %H:%M:%S", true) << "] [" << threadTag() << "] ["
        << logLevelName(level) << "] " << message;

    if (!file.empty() && line > 0) {
        oss << " (" << std::filesystem::path(file).filename().string() << ":" << line << ")";
    }
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_.load()) {
        return;
    }

    // Format outside the lock, workers log concurrently
    const std::string formatted = formatMessage(level, message, file, line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << formatted << '\n';
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
    }
}

} // namespace core
} // namespace rockseg
