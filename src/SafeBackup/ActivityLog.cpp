// =================================================================
// src/SafeBackup/ActivityLog.cpp
// =================================================================
// Implementation for the JSON-lines activity log.

#include "SafeBackup/ActivityLog.hpp"
#include "SafeBackup/BackupError.hpp"
#include "nlohmann/json.hpp"
#include <fstream>

namespace SafeBackup {

ActivityLog::ActivityLog(const WorkspaceContext& context, const std::string& file_name)
    : m_context(context), m_file_name(file_name) {
}

void ActivityLog::record(const std::string& action, const std::string& file,
                         const std::string& result) const {
    std::filesystem::path log_path = path();

    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        throw BackupError(ErrorKind::IO_FAILURE, "Failed to open activity log: " + log_path.string());
    }

    out << formatRecord(action, file, result) << '\n';
    out.flush();
    if (!out) {
        throw BackupError(ErrorKind::IO_FAILURE, "Failed to write activity log: " + log_path.string());
    }
}

std::string ActivityLog::formatRecord(const std::string& action, const std::string& file,
                                      const std::string& result) const {
    nlohmann::ordered_json entry;
    entry["ts"] = m_context.now();
    entry["user"] = m_context.user_name;
    entry["action"] = action;
    entry["file"] = file;
    entry["result"] = result;

    // Replace invalid UTF-8 in user-supplied names instead of throwing
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::filesystem::path ActivityLog::path() const {
    return m_context.resolve(m_file_name);
}

} // namespace SafeBackup
