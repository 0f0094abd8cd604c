// =================================================================
// include/SafeBackup/BackupConfig.hpp
// =================================================================
// Configuration structure for backup operations and logging.

#pragma once

#include "SafeBackup/Logger.hpp"
#include <filesystem>
#include <string>

// Forward declarations to reduce header dependencies
namespace SafeBackup {
    class ConfigParser;
    struct Commands;
}

namespace SafeBackup {

/**
 * @brief Settings read from config.yml and the command line
 *
 * Recognised keys:
 *   working_directory      directory to operate in
 *   activity_log           activity log file name (default logfile.txt)
 *   user                   acting user recorded in the activity log
 *   logging.dir            diagnostic log directory
 *   logging.console_level  debug | info | warning | error | critical
 *   logging.file           true to write diagnostic log files
 */
struct BackupConfig {
    // Workspace settings
    std::string working_directory;              ///< Empty means the process's current directory
    std::string activity_log = "logfile.txt";
    std::string user;                           ///< Empty means the login name

    // Diagnostic logging settings
    std::string log_dir = ".safe_backup/logs";
    LogLevel console_log_level = LogLevel::ERROR;
    bool file_logging = true;

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Diagnostic log directory, anchored at the working directory when relative
     */
    std::filesystem::path logDirectoryIn(const std::filesystem::path& working_directory) const;

    /**
     * @brief Configuration file to read for a command line
     *
     * A relative --config path is taken from the -C directory when one is given.
     */
    static std::filesystem::path configPathFor(const Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return Empty string if valid, otherwise the first problem found
     */
    std::string validate() const;
};

} // namespace SafeBackup
