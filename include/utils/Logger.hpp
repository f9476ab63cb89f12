#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <atomic>
#include <ctime>

namespace riceair {

/**
 * @enum LogLevel
 * @brief Defines severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information.
    INFO,     ///< General informational messages.
    WARNING,  ///< Indicates potential issues.
    ERROR,    ///< Errors hindering specific operations.
    FATAL     ///< Critical errors halting the program.
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger shared by the optimizer, the objective
 *        and the configuration readers.
 *
 * Writes timestamped "[LEVEL] [source] message" lines to stdout and,
 * when enabled, appends them to a log file. Messages below the configured
 * level are dropped before any formatting happens.
 */
class Logger {
public:
    /**
     * @brief Retrieves the singleton instance of the Logger.
     * @return Logger& Reference to the unique logger instance.
     */
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Sets the minimum severity level for messages to be processed.
     *
     * Messages with a level below this setting will be ignored.
     * @param level [in] The minimum LogLevel to output.
     */
    void setLogLevel(LogLevel level) {
        logLevel_.store(level);
    }

    /** @brief Current minimum severity level. */
    LogLevel getLogLevel() const { return logLevel_.load(); }

    /**
     * @brief Configures file logging.
     *
     * Enables or disables logging to a specified file. If enabling and the file
     * is already open, it will be closed and reopened (potentially truncating or appending
     * based on default behavior, which is appending here).
     *
     * @param enable   [in] True to enable file logging, false to disable.
     * @param filename [in] The path to the log file (used only if enable is true). Defaults to "rice_air.log".
     * @return bool True if the requested state (enabled/disabled with file open/closed) was achieved, false on failure (e.g., cannot open file).
     */
    bool enableFileLogging(bool enable, const std::string& filename = "rice_air.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (enable) {
            if (logFile_.is_open()) {
                logFile_.close();
            }
            logFile_.open(filename, std::ios::app);
            if (!logFile_.is_open()) {
                std::cerr << formatLogMessage(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename) << std::endl;
                return false;
            }
            // mutex_ is already held, so write directly instead of going through log().
            logFile_ << formatLogMessage(LogLevel::INFO, "Logger", "File logging enabled to: " + filename) << std::endl;
            return true;
        } else {
            if (logFile_.is_open()) {
                logFile_ << formatLogMessage(LogLevel::INFO, "Logger", "File logging disabled.") << std::endl;
                logFile_.close();
            }
            return true;
        }
    }

    /**
     * @brief Logs a message if its level meets the minimum threshold.
     *
     * This is the core logging method. It formats the message and outputs
     * it to the console and/or file based on current settings. Thread-safe.
     *
     * @param level   [in] The severity level of the message.
     * @param source  [in] Identifier for the source of the message (e.g., class name, function name).
     * @param message [in] The content of the log message.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        if (level < getLogLevel()) return;

        std::string formattedMessage = formatLogMessage(level, source, message);

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& console = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        console << formattedMessage << std::endl;
        if (logFile_.is_open()) {
            logFile_ << formattedMessage << std::endl;
        }
    }

    /**
     * @brief Returns true when messages of the given level would be emitted.
     *
     * Lets callers skip building expensive messages (e.g. per-evaluation traces).
     */
    bool isEnabled(LogLevel level) const { return level >= getLogLevel(); }

    /** @brief Logs a message with DEBUG level. @param source Source identifier. @param message Message content. */
    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    /** @brief Logs a message with INFO level. @param source Source identifier. @param message Message content. */
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    /** @brief Logs a message with WARNING level. @param source Source identifier. @param message Message content. */
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    /** @brief Logs a message with ERROR level. @param source Source identifier. @param message Message content. */
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    /** @brief Logs a message with FATAL level. @param source Source identifier. @param message Message content. */
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

private:
    // Private constructor to enforce singleton pattern.
    Logger() : logLevel_(LogLevel::INFO) {}

    // Prevent copying and assignment.
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Formats a log entry with timestamp, level, source, and message.
     * @param level   [in] The severity level.
     * @param source  [in] The source identifier.
     * @param message [in] The message content.
     * @return std::string The fully formatted log string.
     */
    std::string formatLogMessage(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " ";

        switch (level) {
            case LogLevel::DEBUG:   oss << "[DEBUG]  "; break;
            case LogLevel::INFO:    oss << "[INFO]   "; break;
            case LogLevel::WARNING: oss << "[WARNING]"; break;
            case LogLevel::ERROR:   oss << "[ERROR]  "; break;
            case LogLevel::FATAL:   oss << "[FATAL]  "; break;
        }

        oss << " [" << source << "] " << message;
        return oss.str();
    }

    std::atomic<LogLevel> logLevel_; ///< Minimum level for messages to be processed.
    std::ofstream logFile_;     ///< Output file stream (if file logging is enabled).
    std::mutex mutex_;          ///< Ensures thread safety for log operations.
};

} // namespace riceair

#endif // LOGGER_H