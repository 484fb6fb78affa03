#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <atomic>
#include <fstream>

namespace passcheck {
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
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_ = level; }

    /**
     * Get current log level
     */
    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Set log file (append mode)
     */
    bool setLogFile(const std::string& filename);

    /**
     * Close log file
     */
    void closeLogFile();

    /**
     * Initialize logger with configuration
     */
    bool initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename = "");

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if initialization successful, false otherwise
     */
    bool initializeWithTimestamp(const std::string& logDirectory, LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path
     * @return Path to current log file, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    /**
     * Flush all pending log messages
     */
    void flush();

    /**
     * Log message
     * @param component Optional component tag printed in brackets
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0,
             const std::string& component = "");

    // Convenience methods
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

    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line,
                              const std::string& component) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_DEBUG(msg) passcheck::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) passcheck::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) passcheck::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) passcheck::core::Logger::getInstance().error(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str(), "", 0, component_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define PASSCHECK_LOG_DEBUG(component) \
    passcheck::core::LogStream(passcheck::core::LogLevel::DEBUG, component)

#define PASSCHECK_LOG_INFO(component) \
    passcheck::core::LogStream(passcheck::core::LogLevel::INFO, component)

#define PASSCHECK_LOG_WARNING(component) \
    passcheck::core::LogStream(passcheck::core::LogLevel::WARNING, component)

#define PASSCHECK_LOG_ERROR(component) \
    passcheck::core::LogStream(passcheck::core::LogLevel::ERROR, component)

} // namespace core
} // namespace passcheck
