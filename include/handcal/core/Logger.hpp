#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>

namespace handcal {
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
 *
 * Process-wide singleton. Tracking sessions log calibration transitions at
 * INFO and per-frame events at DEBUG, so the default INFO level keeps the
 * frame loop quiet.
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
    void setLevel(LogLevel level);

    /**
     * Get current log level
     */
    LogLevel getLevel() const;

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable);

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
     * @param component Optional component tag ("Calibrator", "Session", ...)
     */
    void log(LogLevel level, const std::string& message,
             const std::string& component = "", const std::string& file = "", int line = 0);

    // Convenience methods
    void trace(const std::string& msg, const std::string& component = "") {
        log(LogLevel::TRACE, msg, component);
    }

    void debug(const std::string& msg, const std::string& component = "") {
        log(LogLevel::DEBUG, msg, component);
    }

    void info(const std::string& msg, const std::string& component = "") {
        log(LogLevel::INFO, msg, component);
    }

    void warning(const std::string& msg, const std::string& component = "") {
        log(LogLevel::WARNING, msg, component);
    }

    void error(const std::string& msg, const std::string& component = "") {
        log(LogLevel::ERROR, msg, component);
    }

    void critical(const std::string& msg, const std::string& component = "") {
        log(LogLevel::CRITICAL, msg, component);
    }

    /**
     * Check whether a message at this level would be emitted
     */
    bool isEnabled(LogLevel level) const;

    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& component,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component, const char* file, int line)
        : level_(level), component_(component), file_(file), line_(line) {}

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str(), component_, file_, line_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::string file_;
    int line_;
    std::ostringstream stream_;
};

#define HANDCAL_LOG_TRACE(component) \
    handcal::core::LogStream(handcal::core::LogLevel::TRACE, component, __FILE__, __LINE__)

#define HANDCAL_LOG_DEBUG(component) \
    handcal::core::LogStream(handcal::core::LogLevel::DEBUG, component, __FILE__, __LINE__)

#define HANDCAL_LOG_INFO(component) \
    handcal::core::LogStream(handcal::core::LogLevel::INFO, component, __FILE__, __LINE__)

#define HANDCAL_LOG_WARNING(component) \
    handcal::core::LogStream(handcal::core::LogLevel::WARNING, component, __FILE__, __LINE__)

#define HANDCAL_LOG_ERROR(component) \
    handcal::core::LogStream(handcal::core::LogLevel::ERROR, component, __FILE__, __LINE__)

#define HANDCAL_LOG_CRITICAL(component) \
    handcal::core::LogStream(handcal::core::LogLevel::CRITICAL, component, __FILE__, __LINE__)

} // namespace core
} // namespace handcal
