// =================================================================
// src/SafeBackup/BackupManager.cpp
// =================================================================
// Implementation for backup, restore and delete operations.

#include "SafeBackup/BackupManager.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include <system_error>

namespace SafeBackup {

BackupManager::BackupManager(const WorkspaceContext& context, const std::string& activity_log_name)
    : m_context(context),
      m_validator(context),
      m_naming(context),
      m_locator(context),
      m_resolver(context),
      m_activity_log(context, activity_log_name) {
}

std::filesystem::path BackupManager::createBackup(const std::string& name) {
    try {
        std::filesystem::path source = m_validator.validate(name);
        requireExists(source, "source file does not exist");

        std::string trimmed = PathValidator::trim(name);
        uint64_t timestamp = m_context.now();
        std::filesystem::path timestamped = m_naming.timestampedPath(trimmed, timestamp);
        std::filesystem::path plain = m_naming.plainPath(trimmed);

        copyFile(source, timestamped);

        // Backing up "x.bak" makes the plain artifact the source itself
        std::error_code ec;
        if (!std::filesystem::equivalent(source, plain, ec)) {
            copyFile(source, plain);
        }

        m_activity_log.record("backup", name);
        Logger::getInstance().logOperation("backup", name, true, timestamped.string());
        return timestamped;

    } catch (const BackupError& e) {
        Logger::getInstance().logOperation("backup", name, false, e.what());
        throw;
    }
}

std::filesystem::path BackupManager::restoreFile(const std::string& name) {
    try {
        RestorePlan plan = m_resolver.resolve(name, m_context.now());
        Logger::getInstance().debug("BackupManager", "Restore source selected",
                                    plan.source.filename().string());

        copyFile(plan.source, plan.destination);

        m_activity_log.record("restore", name);
        Logger::getInstance().logOperation("restore", name, true, plan.destination.string());
        return plan.destination;

    } catch (const BackupError& e) {
        Logger::getInstance().logOperation("restore", name, false, e.what());
        throw;
    }
}

void BackupManager::deleteFile(const std::string& name) {
    try {
        std::filesystem::path target = m_validator.validate(name);
        requireExists(target, "file does not exist");

        std::error_code ec;
        if (std::filesystem::is_directory(target, ec)) {
            throw BackupError(ErrorKind::IO_FAILURE, "is a directory: " + target.string());
        }

        if (!std::filesystem::remove(target, ec) || ec) {
            throw BackupError(ErrorKind::IO_FAILURE,
                              "Failed to remove " + target.string() + ": " + ec.message());
        }

        m_activity_log.record("delete", name);
        Logger::getInstance().logOperation("delete", name, true, target.string());

    } catch (const BackupError& e) {
        Logger::getInstance().logOperation("delete", name, false, e.what());
        throw;
    }
}

std::vector<BackupEntry> BackupManager::listBackups(const std::string& name) const {
    m_validator.validate(name);
    return m_locator.listBackups(PathValidator::trim(name));
}

void BackupManager::copyFile(const std::filesystem::path& source_path,
                             const std::filesystem::path& dest_path) const {
    try {
        std::filesystem::copy_file(source_path, dest_path,
                                   std::filesystem::copy_options::overwrite_existing);
    } catch (const std::filesystem::filesystem_error& e) {
        throw BackupError(ErrorKind::IO_FAILURE, e.what());
    }
}

void BackupManager::requireExists(const std::filesystem::path& path, const std::string& message) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw BackupError(ErrorKind::NOT_FOUND, message);
    }
}

} // namespace SafeBackup
