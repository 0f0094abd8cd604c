// =================================================================
// include/SafeBackup/Logger.hpp
// =================================================================
// Header for diagnostic logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace SafeBackup {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Diagnostic logger with console and rotating file output
 *
 * Separate from the activity log: nothing written here is read back by
 * any operation. Until initialize() is called only the console is used.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file output
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".safe_backup/logs",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Close the log file and return to console-only output
     */
    void shutdown();

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a backup, restore or delete
     * @param action Operation name
     * @param file Name argument as supplied
     * @param success Whether the operation succeeded
     * @param detail Resulting path or error message
     */
    void logOperation(const std::string& action, const std::string& file,
                      bool success, const std::string& detail);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Path of the current log file, empty when file output is off
     */
    std::string currentLogFile() const;

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARNING"
     * @param name Level name, case-insensitive ("warn" and "crit" accepted)
     * @param level Receives the parsed level
     * @return False if the name is not recognised
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    Logger();
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size;
    size_t m_max_log_files;
    LogLevel m_console_level;
    LogLevel m_file_level;
    bool m_console_enabled;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     * @return False if it could not be created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macro for logging
#define LOG_WARNING(component, message) \
    SafeBackup::Logger::getInstance().warning(component, message)

} // namespace SafeBackup
