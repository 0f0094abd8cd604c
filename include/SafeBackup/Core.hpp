// =================================================================
// include/SafeBackup/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "SafeBackup/CliParser.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace SafeBackup {
    struct BackupConfig;
    class BackupManager;
}

namespace SafeBackup {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInteractive();
    int handleBackup();
    int handleRestore();
    int handleDelete();
    int handleList();

    /**
     * @brief Load configuration, set up logging and the workspace.
     * @return False if configuration is invalid.
     */
    bool initialize();

    const Commands& m_commands;
    std::unique_ptr<BackupConfig> m_config;
    std::unique_ptr<BackupManager> m_manager;
};

} // namespace SafeBackup
