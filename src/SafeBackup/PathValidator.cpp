// =================================================================
// src/SafeBackup/PathValidator.cpp
// =================================================================
// Implementation for file name validation.

#include "SafeBackup/PathValidator.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace SafeBackup {

PathValidator::PathValidator(const WorkspaceContext& context)
    : m_context(context) {
}

std::filesystem::path PathValidator::validate(const std::string& name) const {
    std::string reason = checkName(name);
    if (!reason.empty()) {
        Logger::getInstance().warning("PathValidator", "Rejected file name: " + reason, name);
        throw BackupError(ErrorKind::INVALID_INPUT, reason);
    }

    return m_context.resolve(trim(name));
}

std::string PathValidator::checkName(const std::string& name) const {
    std::string trimmed = trim(name);

    if (trimmed.empty()) {
        return "empty file name";
    }
    if (isAbsolute(trimmed)) {
        return "absolute paths not allowed";
    }
    if (hasParentTraversal(trimmed)) {
        return "parent traversal not allowed";
    }
    return "";
}

std::string PathValidator::trim(const std::string& s) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

bool PathValidator::isAbsolute(const std::string& name) {
    std::filesystem::path p(name);
    return p.is_absolute() || p.has_root_path();
}

bool PathValidator::hasParentTraversal(const std::string& name) {
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    // Covers "../x", "a/../b", "./../x" as well as a bare or trailing ".."
    std::istringstream segments(normalized);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "..") {
            return true;
        }
    }
    return false;
}

} // namespace SafeBackup
