// =================================================================
// src/SafeBackup/BackupConfig.cpp
// =================================================================
// Implementation for configuration management.

#include "SafeBackup/BackupConfig.hpp"
#include "SafeBackup/CliParser.hpp"
#include "SafeBackup/ConfigParser.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace SafeBackup {

namespace {

bool parseBool(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

void BackupConfig::loadFromConfig(const ConfigParser& config) {
    std::string dir_str = config.getStringValue("working_directory");
    if (!dir_str.empty()) {
        working_directory = dir_str;
    }

    std::string activity_log_str = config.getStringValue("activity_log");
    if (!activity_log_str.empty()) {
        activity_log = activity_log_str;
    }

    std::string user_str = config.getStringValue("user");
    if (!user_str.empty()) {
        user = user_str;
    }

    std::string log_dir_str = config.getStringValue("logging.dir");
    if (!log_dir_str.empty()) {
        log_dir = log_dir_str;
    }

    std::string level_str = config.getStringValue("logging.console_level");
    if (!level_str.empty()) {
        LogLevel level;
        if (Logger::parseLevel(level_str, level)) {
            console_log_level = level;
        } else {
            LOG_WARNING("BackupConfig", "Invalid logging.console_level value, using default");
        }
    }

    std::string file_str = config.getStringValue("logging.file");
    if (!file_str.empty()) {
        bool enabled;
        if (parseBool(file_str, enabled)) {
            file_logging = enabled;
        } else {
            LOG_WARNING("BackupConfig", "Invalid logging.file value, using default");
        }
    }
}

void BackupConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.directory.empty()) {
        working_directory = commands.directory;
    }

    if (commands.verbose) {
        console_log_level = LogLevel::DEBUG;
    }
}

std::filesystem::path BackupConfig::logDirectoryIn(const std::filesystem::path& working_directory) const {
    std::filesystem::path dir(log_dir);
    if (dir.is_absolute()) {
        return dir;
    }
    return working_directory / dir;
}

std::filesystem::path BackupConfig::configPathFor(const Commands& commands) {
    std::filesystem::path path(commands.config_path);
    if (path.is_absolute() || commands.directory.empty()) {
        return path;
    }
    return std::filesystem::path(commands.directory) / path;
}

std::string BackupConfig::validate() const {
    if (activity_log.empty()) {
        return "activity_log must not be empty";
    }

    std::filesystem::path log_name(activity_log);
    if (log_name.has_root_path() || activity_log.find('/') != std::string::npos ||
        activity_log.find('\\') != std::string::npos) {
        return "activity_log must be a plain file name: " + activity_log;
    }
    if (activity_log == "." || activity_log == "..") {
        return "activity_log must be a plain file name: " + activity_log;
    }

    if (file_logging && log_dir.empty()) {
        return "logging.dir must not be empty when logging.file is enabled";
    }

    return "";
}

} // namespace SafeBackup
