// =================================================================
// src/SafeBackup/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "SafeBackup/CliParser.hpp"

namespace SafeBackup {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "safe_backup: point-in-time backup, restore and delete of files in one directory.\n"
        "Run without a command for the interactive prompt.");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupGlobalOptions(*m_app);

    // Subcommands inherit this, so global options may follow the file name
    m_app->fallthrough();

    setupFileCommand(*m_app, "backup", "Copies a file to <name>.<timestamp>.bak and <stem>.bak.");
    setupFileCommand(*m_app, "restore",
                     "Restores from a backup name, or from the latest backup of an original name.");
    setupFileCommand(*m_app, "delete", "Deletes a file in the working directory.");
    setupFileCommand(*m_app, "list", "Lists the backups of a file.");

    m_app->require_subcommand(0, 1);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupGlobalOptions(CLI::App& app) {
    app.add_option("--config", m_commands.config_path, "Path to the YAML configuration file.");
    app.add_option("-C,--directory", m_commands.directory, "Directory to operate in (default: current directory).")
        ->check(CLI::ExistingDirectory);
    app.add_flag("-v,--verbose", m_commands.verbose, "Print debug diagnostics to the console.");
}

void CliParser::setupFileCommand(CLI::App& app, const std::string& name, const std::string& description) {
    auto* sub = app.add_subcommand(name, description);
    sub->add_option("file", m_commands.file_name, "The file name, relative to the working directory.")->required();
}

} // namespace SafeBackup
