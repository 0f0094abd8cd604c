// =================================================================
// include/SafeBackup/PathValidator.hpp
// =================================================================
// Rejects unsafe file names before any file-system operation runs.

#pragma once

#include "SafeBackup/WorkspaceContext.hpp"
#include <filesystem>
#include <string>

namespace SafeBackup {

/**
 * @brief Validates user-supplied file names against the working directory
 *
 * A name is accepted only if, once trimmed, it is non-empty, relative and
 * free of ".." segments. Accepted names are anchored at the working
 * directory without canonicalization, so symlinks are left unresolved.
 */
class PathValidator {
public:
    /**
     * @brief Construct a new PathValidator
     * @param context Workspace the accepted names are anchored at
     */
    explicit PathValidator(const WorkspaceContext& context);

    /**
     * @brief Validate a name and resolve it against the working directory
     * @param name Raw user input
     * @return working_directory / trimmed name
     * @throws BackupError with ErrorKind::INVALID_INPUT on rejection
     */
    std::filesystem::path validate(const std::string& name) const;

    /**
     * @brief Check a name without resolving it
     * @param name Raw user input
     * @return Empty string if acceptable, otherwise the rejection reason
     */
    std::string checkName(const std::string& name) const;

    /**
     * @brief Strip surrounding whitespace
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Check whether a name denotes an absolute or rooted path on this host
     */
    static bool isAbsolute(const std::string& name);

    /**
     * @brief Check whether any segment of a name is ".."
     *
     * Backslashes count as separators for this check only.
     */
    static bool hasParentTraversal(const std::string& name);

private:
    WorkspaceContext m_context;
};

} // namespace SafeBackup
