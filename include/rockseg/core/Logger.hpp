#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace rockseg {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse "trace", "debug", "info", "warning", "error" or "critical"
 * (case-insensitive)
 * @return false if @p name is not a level, @p level untouched
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

std::string logLevelName(LogLevel level);

/**
 * Thread-safe logger shared by the pipeline and its worker threads
 *
 * Every line carries a timestamp, a short tag of the calling thread and the
 * level, so messages from boundary fill workers can be told apart. Errors go
 * to stderr, everything else to stdout, and all of it to the log file when
 * one is open.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }
    LogLevel getLevel() const { return minLevel_; }

    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Start logging to <logDirectory>/log_rockseg_<timestamp>.txt
     *
     * Creates the directory (and parents) if needed and writes a run header.
     * @return true if file logging is active, false if console only
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * @return Path of the open log file, empty when logging to console only
     */
    std::string getCurrentLogFile() const;

    void closeLogFile();

    void flush();

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;

    // Caller holds mutex_
    bool openLogFile(const std::string& filename);

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

#define LOG_TRACE(msg) rockseg::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) rockseg::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) rockseg::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) rockseg::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) rockseg::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) rockseg::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

/**
 * Stream-style message, written when the temporary is destroyed
 *
 * The message is prefixed with "[component] ".
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component, const char* file, int line)
        : level_(level), file_(file), line_(line) {
        if (!component.empty()) {
            stream_ << "[" << component << "] ";
        }
    }

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str(), file_, line_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream stream_;
};

#define ROCKSEG_LOG_DEBUG(component) \
    rockseg::core::LogStream(rockseg::core::LogLevel::DEBUG, component, __FILE__, __LINE__)

#define ROCKSEG_LOG_INFO(component) \
    rockseg::core::LogStream(rockseg::core::LogLevel::INFO, component, __FILE__, __LINE__)

#define ROCKSEG_LOG_WARNING(component) \
    rockseg::core::LogStream(rockseg::core::LogLevel::WARNING, component, __FILE__, __LINE__)

#define ROCKSEG_LOG_ERROR(component) \
    rockseg::core::LogStream(rockseg::core::LogLevel::ERROR, component, __FILE__, __LINE__)

} // namespace core
} // namespace rockseg
