// =================================================================
// include/SafeBackup/BackupLocator.hpp
// =================================================================
// Finds existing backups of an original file in the working directory.

#pragma once

#include "SafeBackup/BackupNaming.hpp"
#include "SafeBackup/WorkspaceContext.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace SafeBackup {

/**
 * @brief A backup artifact found on disk
 */
struct BackupEntry {
    std::filesystem::path path;   ///< Absolute artifact path
    uint64_t timestamp;           ///< Embedded seconds (0 for the plain backup)
    uintmax_t file_size;          ///< Artifact size in bytes
    bool is_plain;                ///< True for "<stem>.bak"

    BackupEntry() : timestamp(0), file_size(0), is_plain(false) {}
    BackupEntry(const std::filesystem::path& p, uint64_t ts, uintmax_t size, bool plain)
        : path(p), timestamp(ts), file_size(size), is_plain(plain) {}
};

/**
 * @brief Scans the working directory for backups of a given original
 *
 * Only regular files directly inside the working directory are considered.
 * Entries that do not match "<basename>.<digits>.bak" are ignored rather
 * than reported.
 */
class BackupLocator {
public:
    explicit BackupLocator(const WorkspaceContext& context);

    /**
     * @brief Find the most recent backup of an original file
     *
     * The timestamped backup with the largest timestamp wins; equal
     * timestamps go to the lexically smallest file name. Without any
     * timestamped backup the plain "<stem>.bak" is used if it exists.
     *
     * @param original Original file name
     * @return Absolute path of the selected backup
     * @throws BackupError INVALID_INPUT if original has no base name,
     *         NOT_FOUND if no backup exists, IO_FAILURE if the scan fails
     */
    std::filesystem::path findLatest(const std::string& original) const;

    /**
     * @brief List all backups of an original file
     * @param original Original file name
     * @return Timestamped backups oldest first, then the plain backup if present
     */
    std::vector<BackupEntry> listBackups(const std::string& original) const;

private:
    WorkspaceContext m_context;
    BackupNaming m_naming;

    /**
     * @brief Collect timestamped backups of a base name, unsorted
     */
    std::vector<BackupEntry> scanTimestampedBackups(const std::string& base_name) const;
};

} // namespace SafeBackup
