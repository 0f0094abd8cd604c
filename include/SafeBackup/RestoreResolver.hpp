// =================================================================
// include/SafeBackup/RestoreResolver.hpp
// =================================================================
// Decides which backup to read and where to write on restore.

#pragma once

#include "SafeBackup/BackupLocator.hpp"
#include "SafeBackup/BackupNaming.hpp"
#include "SafeBackup/PathValidator.hpp"
#include "SafeBackup/WorkspaceContext.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace SafeBackup {

/**
 * @brief How the restore source was chosen
 */
enum class RestoreSource {
    TIMESTAMPED_BACKUP,  ///< Named "<orig>.<ts>.bak", written back to "<orig>"
    PLAIN_BACKUP,        ///< Named "<stem>.bak", written to "<stem>.restored.<now>"
    LATEST_BACKUP        ///< Original name given, latest backup located
};

/**
 * @brief Source and destination of a restore
 */
struct RestorePlan {
    std::filesystem::path source;       ///< Backup artifact to read
    std::filesystem::path destination;  ///< File to write
    RestoreSource origin;               ///< Which rule produced the plan

    RestorePlan() : origin(RestoreSource::LATEST_BACKUP) {}
    RestorePlan(const std::filesystem::path& src, const std::filesystem::path& dest, RestoreSource o)
        : source(src), destination(dest), origin(o) {}
};

/**
 * @brief Resolves restore requests given either a backup or an original name
 *
 * Names ending in ".bak" are treated as backups and must exist. Any other
 * name is an original whose latest backup is looked up. Nothing is copied
 * here; the caller performs the write.
 */
class RestoreResolver {
public:
    explicit RestoreResolver(const WorkspaceContext& context);

    /**
     * @brief Build the restore plan for a name
     * @param name Backup file name or original file name
     * @param now Seconds used for "<stem>.restored.<now>" destinations
     * @return Resolved plan
     * @throws BackupError INVALID_INPUT for unsafe or unparseable names,
     *         NOT_FOUND when the backup does not exist or none is located
     */
    RestorePlan resolve(const std::string& name, uint64_t now) const;

private:
    WorkspaceContext m_context;
    PathValidator m_validator;
    BackupLocator m_locator;

    RestorePlan resolveFromBackupName(const std::string& name, uint64_t now) const;
    RestorePlan resolveFromOriginalName(const std::string& name) const;
};

} // namespace SafeBackup
