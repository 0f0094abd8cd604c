// =================================================================
// src/SafeBackup/Logger.cpp
// =================================================================
// Implementation for diagnostic logging.

#include "SafeBackup/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace SafeBackup {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_max_log_size(10 * 1024 * 1024),
      m_max_log_files(5),
      m_console_level(LogLevel::ERROR),
      m_file_level(LogLevel::DEBUG),
      m_console_enabled(true),
      m_current_log_size(0) {
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;

    if (!ensureLogDirectory()) {
        m_current_log_file.reset();
        m_current_log_filename.clear();
        return;
    }

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        m_current_log_filename.clear();
        return;
    }

    debug("Logger", "Logging system initialized", m_log_dir);
}

void Logger::shutdown() {
    flush();
    m_current_log_file.reset();
    m_current_log_filename.clear();
    m_current_log_size = 0;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logOperation(const std::string& action, const std::string& file,
                          bool success, const std::string& detail) {
    std::ostringstream context;
    context << "File: " << file << ", ";
    context << (success ? "Result: " : "Error: ") << detail;

    if (success) {
        info("BackupManager", action + " completed", context.str());
    } else {
        warning("BackupManager", action + " failed", context.str());
    }
}

void Logger::flush() {
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::currentLogFile() const {
    return m_current_log_filename;
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else if (lower == "critical" || lower == "crit") {
        level = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

bool Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        return false;
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream stamp;
    stamp << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");

    // Rotation can happen more than once within the same second
    std::string base = m_log_dir + "/safe_backup_" + stamp.str();
    std::string filename = base + ".log";
    std::error_code ec;
    for (int suffix = 1; std::filesystem::exists(filename, ec) && suffix < 1000; suffix++) {
        filename = base + "_" + std::to_string(suffix) + ".log";
    }

    return filename;
}

} // namespace SafeBackup
