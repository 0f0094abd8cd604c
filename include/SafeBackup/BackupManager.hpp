// =================================================================
// include/SafeBackup/BackupManager.hpp
// =================================================================
// Header for backup, restore and delete operations.

#pragma once

#include "SafeBackup/ActivityLog.hpp"
#include "SafeBackup/BackupLocator.hpp"
#include "SafeBackup/BackupNaming.hpp"
#include "SafeBackup/PathValidator.hpp"
#include "SafeBackup/RestoreResolver.hpp"
#include "SafeBackup/WorkspaceContext.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace SafeBackup {

/**
 * @brief Point-in-time backup, restore and delete of files in one directory
 *
 * Every name is validated before the file system is touched. A backup
 * writes "<basename>.<ts>.bak" and overwrites "<stem>.bak", both next to
 * each other in the working directory. Successful operations append a
 * record to the activity log; a failure to write that record fails the
 * operation. Errors are raised as BackupError and never retried.
 */
class BackupManager {
public:
    /**
     * @brief Construct a new BackupManager
     * @param context Workspace to operate in
     * @param activity_log_name Activity log file name inside the workspace
     */
    explicit BackupManager(const WorkspaceContext& context,
                           const std::string& activity_log_name = ActivityLog::DEFAULT_FILE_NAME);

    /**
     * @brief Back up a file
     * @param name Original file name
     * @return Path of the timestamped backup
     */
    std::filesystem::path createBackup(const std::string& name);

    /**
     * @brief Restore from a backup name or from the latest backup of an original
     * @param name Backup file name ("*.bak") or original file name
     * @return Path of the restored file
     */
    std::filesystem::path restoreFile(const std::string& name);

    /**
     * @brief Delete a file
     * @param name File name
     */
    void deleteFile(const std::string& name);

    /**
     * @brief List backups of an original file
     * @param name Original file name
     * @return Timestamped backups oldest first, then the plain backup if present
     */
    std::vector<BackupEntry> listBackups(const std::string& name) const;

    const WorkspaceContext& getContext() const { return m_context; }

private:
    WorkspaceContext m_context;
    PathValidator m_validator;
    BackupNaming m_naming;
    BackupLocator m_locator;
    RestoreResolver m_resolver;
    ActivityLog m_activity_log;

    /**
     * @brief Copy a file, replacing the destination
     * @throws BackupError IO_FAILURE with the storage layer's message
     */
    void copyFile(const std::filesystem::path& source_path,
                  const std::filesystem::path& dest_path) const;

    /**
     * @brief Require a path to exist
     * @throws BackupError NOT_FOUND with the given message
     */
    void requireExists(const std::filesystem::path& path, const std::string& message) const;
};

} // namespace SafeBackup
