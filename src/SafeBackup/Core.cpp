// =================================================================
// src/SafeBackup/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "SafeBackup/Core.hpp"
#include "SafeBackup/BackupConfig.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/BackupManager.hpp"
#include "SafeBackup/ConfigParser.hpp"
#include "SafeBackup/InteractiveSession.hpp"
#include "SafeBackup/Logger.hpp"
#include "SafeBackup/WorkspaceContext.hpp"
#include <iostream>
#include <filesystem>
#include <system_error>

namespace SafeBackup {

namespace {

int reportError(const BackupError& e) {
    std::cerr << "[ERROR] " << getErrorKindName(e.kind()) << ": " << e.what() << std::endl;
    return 1;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<BackupConfig>()) {
}

Core::~Core() {
    Logger::getInstance().shutdown();
}

int Core::run() {
    try {
        if (!initialize()) {
            return 1;
        }
    } catch (const BackupError& e) {
        return reportError(e);
    }

    if (m_commands.active_command.empty()) {
        return handleInteractive();
    } else if (m_commands.active_command == "backup") {
        return handleBackup();
    } else if (m_commands.active_command == "restore") {
        return handleRestore();
    } else if (m_commands.active_command == "delete") {
        return handleDelete();
    } else if (m_commands.active_command == "list") {
        return handleList();
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

bool Core::initialize() {
    ConfigParser parser(BackupConfig::configPathFor(m_commands).string());
    m_config->loadFromConfig(parser);
    m_config->applyCommandOverrides(m_commands);

    std::string problem = m_config->validate();
    if (!problem.empty()) {
        std::cerr << "[FATAL] Invalid configuration: " << problem << std::endl;
        return false;
    }

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(m_config->console_log_level);

    WorkspaceContext context = WorkspaceContext::fromProcess();
    if (!m_config->working_directory.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(m_config->working_directory, ec)) {
            std::cerr << "[FATAL] Working directory does not exist: "
                      << m_config->working_directory << std::endl;
            return false;
        }
        context.working_directory = std::filesystem::absolute(m_config->working_directory, ec);
        if (ec) {
            std::cerr << "[FATAL] Cannot resolve working directory: " << ec.message() << std::endl;
            return false;
        }
    }
    if (!m_config->user.empty()) {
        context.user_name = m_config->user;
    }

    if (m_config->file_logging) {
        logger.initialize(m_config->logDirectoryIn(context.working_directory).string());
    }

    logger.info("Core", "Session started",
                "Directory: " + context.working_directory.string() + ", User: " + context.user_name);

    m_manager = std::make_unique<BackupManager>(context, m_config->activity_log);
    return true;
}

int Core::handleInteractive() {
    InteractiveSession session(*m_manager);
    int failures = session.run();
    Logger::getInstance().info("Core", "Interactive session ended",
                               "Failed operations: " + std::to_string(failures));
    return 0;
}

int Core::handleBackup() {
    try {
        auto path = m_manager->createBackup(m_commands.file_name);
        std::cout << "Your backup created: " << path.filename().string() << std::endl;
        return 0;
    } catch (const BackupError& e) {
        return reportError(e);
    }
}

int Core::handleRestore() {
    try {
        auto path = m_manager->restoreFile(m_commands.file_name);
        std::cout << "Your file has been restored: " << path.filename().string() << std::endl;
        return 0;
    } catch (const BackupError& e) {
        return reportError(e);
    }
}

int Core::handleDelete() {
    try {
        m_manager->deleteFile(m_commands.file_name);
        std::cout << "Deleted: " << m_commands.file_name << std::endl;
        return 0;
    } catch (const BackupError& e) {
        return reportError(e);
    }
}

int Core::handleList() {
    try {
        auto entries = m_manager->listBackups(m_commands.file_name);
        if (entries.empty()) {
            std::cout << "No backups found for: " << m_commands.file_name << std::endl;
            return 0;
        }
        for (const auto& entry : entries) {
            std::cout << entry.path.filename().string() << "\t" << entry.file_size;
            if (entry.is_plain) {
                std::cout << "\tlatest";
            } else {
                std::cout << "\t" << entry.timestamp;
            }
            std::cout << std::endl;
        }
        return 0;
    } catch (const BackupError& e) {
        return reportError(e);
    }
}

} // namespace SafeBackup
