// =================================================================
// src/SafeBackup/RestoreResolver.cpp
// =================================================================
// Implementation for restore target resolution.

#include "SafeBackup/RestoreResolver.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include <system_error>

namespace SafeBackup {

RestoreResolver::RestoreResolver(const WorkspaceContext& context)
    : m_context(context), m_validator(context), m_locator(context) {
}

RestorePlan RestoreResolver::resolve(const std::string& name, uint64_t now) const {
    std::string trimmed = PathValidator::trim(name);
    std::string extension = BackupNaming::BACKUP_EXTENSION;

    bool is_backup_name = trimmed.size() >= extension.size() &&
        trimmed.compare(trimmed.size() - extension.size(), extension.size(), extension) == 0;

    return is_backup_name ? resolveFromBackupName(trimmed, now)
                          : resolveFromOriginalName(trimmed);
}

RestorePlan RestoreResolver::resolveFromBackupName(const std::string& name, uint64_t now) const {
    std::filesystem::path source = m_validator.validate(name);

    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        throw BackupError(ErrorKind::NOT_FOUND, "backup file not found");
    }

    BackupNameInfo info = BackupNaming::classifyBackupName(BackupNaming::baseName(name));

    switch (info.kind) {
        case BackupNameKind::TIMESTAMPED:
            return RestorePlan(source, m_context.resolve(info.logical_name),
                               RestoreSource::TIMESTAMPED_BACKUP);

        case BackupNameKind::PLAIN:
            return RestorePlan(source,
                               m_context.resolve(info.logical_name + ".restored." + std::to_string(now)),
                               RestoreSource::PLAIN_BACKUP);

        case BackupNameKind::NOT_A_BACKUP:
        default:
            Logger::getInstance().warning("RestoreResolver", "Unparseable backup name", name);
            throw BackupError(ErrorKind::INVALID_INPUT, "unparseable backup name: " + name);
    }
}

RestorePlan RestoreResolver::resolveFromOriginalName(const std::string& name) const {
    m_validator.validate(name);

    std::filesystem::path source = m_locator.findLatest(name);
    return RestorePlan(source, m_context.resolve(BackupNaming::baseName(name)),
                       RestoreSource::LATEST_BACKUP);
}

} // namespace SafeBackup
