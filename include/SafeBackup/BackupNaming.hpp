// =================================================================
// include/SafeBackup/BackupNaming.hpp
// =================================================================
// Derives and classifies backup artifact names.

#pragma once

#include "SafeBackup/WorkspaceContext.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace SafeBackup {

/**
 * @brief What a file name says about itself as a backup artifact
 */
enum class BackupNameKind {
    TIMESTAMPED,   ///< "<orig>.<unix-seconds>.bak"
    PLAIN,         ///< "<stem>.bak"
    NOT_A_BACKUP   ///< Anything else
};

/**
 * @brief Result of classifying a backup file name
 */
struct BackupNameInfo {
    BackupNameKind kind;        ///< Detected form
    std::string logical_name;   ///< "<orig>" for TIMESTAMPED, "<stem>" for PLAIN
    uint64_t timestamp;         ///< Embedded seconds, 0 unless TIMESTAMPED

    BackupNameInfo() : kind(BackupNameKind::NOT_A_BACKUP), timestamp(0) {}
    BackupNameInfo(BackupNameKind k, const std::string& name, uint64_t ts = 0)
        : kind(k), logical_name(name), timestamp(ts) {}
};

/**
 * @brief Builds backup artifact names and paths for an original file
 *
 * Both artifacts land directly in the working directory, whatever
 * directory the original was named with. No directories are created.
 */
class BackupNaming {
public:
    static constexpr const char* BACKUP_EXTENSION = ".bak";

    /**
     * @brief Construct a new BackupNaming
     * @param context Workspace the artifact paths are anchored at
     */
    explicit BackupNaming(const WorkspaceContext& context);

    /**
     * @brief Absolute path of "<basename>.<ts>.bak" in the working directory
     * @throws BackupError INVALID_INPUT if original has no base name
     */
    std::filesystem::path timestampedPath(const std::string& original, uint64_t timestamp) const;

    /**
     * @brief Absolute path of "<stem>.bak" in the working directory
     * @throws BackupError INVALID_INPUT if original has no base name
     */
    std::filesystem::path plainPath(const std::string& original) const;

    /**
     * @brief Final path segment of a name
     * @param original File name, possibly with directory components
     * @return Base name including its extension
     * @throws BackupError INVALID_INPUT for empty, root-only, "." or ".." input
     */
    static std::string baseName(const std::string& original);

    /**
     * @brief Base name with its last extension removed
     *
     * A name without extension (or a dot-file such as ".profile") is its own stem.
     */
    static std::string stem(const std::string& original);

    static std::string timestampedName(const std::string& original, uint64_t timestamp);
    static std::string plainName(const std::string& original);

    /**
     * @brief Classify a backup file name
     * @param file_name Base name of the candidate artifact
     * @return Tagged classification
     */
    static BackupNameInfo classifyBackupName(const std::string& file_name);

    /**
     * @brief Match "<base_name>.[...].<digits>.bak"
     *
     * The name must start with "<base_name>." and end with ".bak"; the segment
     * after the last remaining dot is parsed as the timestamp.
     * @param file_name Candidate directory entry name
     * @param base_name Base name of the original file
     * @return Embedded timestamp, or nullopt if the name is not such a backup
     */
    static std::optional<uint64_t> matchTimestampedBackup(const std::string& file_name,
                                                          const std::string& base_name);

    /**
     * @brief Parse a non-empty run of decimal digits, with an optional leading '+', that fits in 64 bits
     */
    static std::optional<uint64_t> parseTimestamp(const std::string& digits);

private:
    WorkspaceContext m_context;
};

} // namespace SafeBackup
