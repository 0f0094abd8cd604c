// =================================================================
// src/SafeBackup/BackupNaming.cpp
// =================================================================
// Implementation for backup artifact naming.

#include "SafeBackup/BackupNaming.hpp"
#include "SafeBackup/BackupError.hpp"
#include <limits>

namespace SafeBackup {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string stripBackupExtension(const std::string& file_name) {
    return file_name.substr(0, file_name.size() - std::char_traits<char>::length(BackupNaming::BACKUP_EXTENSION));
}

} // namespace

BackupNaming::BackupNaming(const WorkspaceContext& context)
    : m_context(context) {
}

std::filesystem::path BackupNaming::timestampedPath(const std::string& original, uint64_t timestamp) const {
    return m_context.resolve(timestampedName(original, timestamp));
}

std::filesystem::path BackupNaming::plainPath(const std::string& original) const {
    return m_context.resolve(plainName(original));
}

std::string BackupNaming::baseName(const std::string& original) {
    std::string name = std::filesystem::path(original).filename().string();
    if (name.empty() || name == "." || name == "..") {
        throw BackupError(ErrorKind::INVALID_INPUT, "invalid file name");
    }
    return name;
}

std::string BackupNaming::stem(const std::string& original) {
    std::string base = baseName(original);
    std::string result = std::filesystem::path(base).stem().string();
    return result.empty() ? base : result;
}

std::string BackupNaming::timestampedName(const std::string& original, uint64_t timestamp) {
    return baseName(original) + "." + std::to_string(timestamp) + BACKUP_EXTENSION;
}

std::string BackupNaming::plainName(const std::string& original) {
    return stem(original) + BACKUP_EXTENSION;
}

BackupNameInfo BackupNaming::classifyBackupName(const std::string& file_name) {
    if (!endsWith(file_name, BACKUP_EXTENSION)) {
        return BackupNameInfo();
    }

    std::string remainder = stripBackupExtension(file_name);
    if (remainder.empty()) {
        return BackupNameInfo();
    }

    size_t last_dot = remainder.rfind('.');
    if (last_dot != std::string::npos) {
        auto timestamp = parseTimestamp(remainder.substr(last_dot + 1));
        if (timestamp) {
            // Internal dots of the original name are kept; only the last segment is the timestamp
            std::string logical = remainder.substr(0, last_dot);
            if (logical.empty()) {
                return BackupNameInfo();
            }
            return BackupNameInfo(BackupNameKind::TIMESTAMPED, logical, *timestamp);
        }
    }

    return BackupNameInfo(BackupNameKind::PLAIN, remainder);
}

std::optional<uint64_t> BackupNaming::matchTimestampedBackup(const std::string& file_name,
                                                             const std::string& base_name) {
    std::string prefix = base_name + ".";
    if (file_name.size() <= prefix.size() + std::char_traits<char>::length(BACKUP_EXTENSION) ||
        file_name.compare(0, prefix.size(), prefix) != 0 ||
        !endsWith(file_name, BACKUP_EXTENSION)) {
        return std::nullopt;
    }

    // Only the segment after the last dot is the timestamp, so "<base>.old.900.bak" matches too
    std::string remainder = stripBackupExtension(file_name);
    return parseTimestamp(remainder.substr(remainder.rfind('.') + 1));
}

std::optional<uint64_t> BackupNaming::parseTimestamp(const std::string& digits) {
    size_t start = (!digits.empty() && digits[0] == '+') ? 1 : 0;
    if (digits.size() == start) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : digits.substr(start)) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace SafeBackup
