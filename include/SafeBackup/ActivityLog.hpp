// =================================================================
// include/SafeBackup/ActivityLog.hpp
// =================================================================
// Append-only audit record of successful operations.

#pragma once

#include "SafeBackup/WorkspaceContext.hpp"
#include <filesystem>
#include <string>

namespace SafeBackup {

/**
 * @brief Writes one JSON line per successful operation
 *
 * Each record holds ts, user, action, file and result in that order, e.g.
 * {"ts":1700000000,"user":"alice","action":"backup","file":"notes.md","result":"ok"}.
 * The file is opened in append mode for every record and never read back.
 */
class ActivityLog {
public:
    static constexpr const char* DEFAULT_FILE_NAME = "logfile.txt";

    /**
     * @brief Construct a new ActivityLog
     * @param context Workspace supplying directory, clock and user
     * @param file_name Log file name inside the working directory
     */
    explicit ActivityLog(const WorkspaceContext& context,
                         const std::string& file_name = DEFAULT_FILE_NAME);

    /**
     * @brief Append a record
     * @param action "backup", "restore" or "delete"
     * @param file Name argument exactly as supplied by the user
     * @param result Outcome, "ok" on success
     * @throws BackupError IO_FAILURE if the record cannot be written
     */
    void record(const std::string& action, const std::string& file,
                const std::string& result = "ok") const;

    /**
     * @brief Render a record without writing it
     */
    std::string formatRecord(const std::string& action, const std::string& file,
                             const std::string& result) const;

    /**
     * @brief Absolute path of the log file
     */
    std::filesystem::path path() const;

private:
    WorkspaceContext m_context;
    std::string m_file_name;
};

} // namespace SafeBackup
