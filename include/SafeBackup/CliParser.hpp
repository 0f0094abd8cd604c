// =================================================================
// include/SafeBackup/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace SafeBackup {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered, empty for interactive mode

    // Argument shared by 'backup', 'restore', 'delete' and 'list'
    std::string file_name;

    // Global options
    std::string config_path = ".safe_backup/config.yml";
    std::string directory;      // Overrides the working directory when set
    bool verbose = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupGlobalOptions(CLI::App& app);
    void setupFileCommand(CLI::App& app, const std::string& name, const std::string& description);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace SafeBackup
