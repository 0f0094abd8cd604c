// =================================================================
// src/SafeBackup/BackupLocator.cpp
// =================================================================
// Implementation for locating backups in the working directory.

#include "SafeBackup/BackupLocator.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include <algorithm>
#include <system_error>

namespace SafeBackup {

BackupLocator::BackupLocator(const WorkspaceContext& context)
    : m_context(context), m_naming(context) {
}

std::filesystem::path BackupLocator::findLatest(const std::string& original) const {
    std::string base_name = BackupNaming::baseName(original);
    auto candidates = scanTimestampedBackups(base_name);

    const BackupEntry* newest = nullptr;
    for (const auto& candidate : candidates) {
        if (newest == nullptr ||
            candidate.timestamp > newest->timestamp ||
            (candidate.timestamp == newest->timestamp &&
             candidate.path.filename() < newest->path.filename())) {
            newest = &candidate;
        }
    }

    if (newest != nullptr) {
        Logger::getInstance().debug("BackupLocator", "Latest backup for " + base_name,
                                    newest->path.filename().string());
        return newest->path;
    }

    std::filesystem::path plain = m_naming.plainPath(original);
    std::error_code ec;
    if (std::filesystem::exists(plain, ec)) {
        Logger::getInstance().debug("BackupLocator", "Falling back to plain backup for " + base_name,
                                    plain.filename().string());
        return plain;
    }

    throw BackupError(ErrorKind::NOT_FOUND, "no backup file found");
}

std::vector<BackupEntry> BackupLocator::listBackups(const std::string& original) const {
    std::string base_name = BackupNaming::baseName(original);
    auto entries = scanTimestampedBackups(base_name);

    std::sort(entries.begin(), entries.end(),
              [](const BackupEntry& a, const BackupEntry& b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp < b.timestamp;
                  }
                  return a.path.filename() < b.path.filename();
              });

    std::filesystem::path plain = m_naming.plainPath(original);
    std::error_code ec;
    if (std::filesystem::is_regular_file(plain, ec)) {
        uintmax_t size = std::filesystem::file_size(plain, ec);
        entries.emplace_back(plain, 0, ec ? 0 : size, true);
    }

    return entries;
}

std::vector<BackupEntry> BackupLocator::scanTimestampedBackups(const std::string& base_name) const {
    std::vector<BackupEntry> entries;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(m_context.working_directory)) {
            std::error_code ec;
            if (!entry.is_regular_file(ec)) {
                continue;
            }

            std::string file_name = entry.path().filename().string();
            auto timestamp = BackupNaming::matchTimestampedBackup(file_name, base_name);
            if (!timestamp) {
                continue;
            }

            uintmax_t size = entry.file_size(ec);
            entries.emplace_back(entry.path(), *timestamp, ec ? 0 : size, false);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw BackupError(ErrorKind::IO_FAILURE, e.what());
    }

    return entries;
}

} // namespace SafeBackup
