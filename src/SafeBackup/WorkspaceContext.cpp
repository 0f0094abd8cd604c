// =================================================================
// src/SafeBackup/WorkspaceContext.cpp
// =================================================================
// Implementation for the explicit workspace context.

#include "SafeBackup/WorkspaceContext.hpp"
#include <chrono>
#include <cstdlib>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#include <pwd.h>
#endif

namespace SafeBackup {

WorkspaceContext WorkspaceContext::fromProcess() {
    return WorkspaceContext(std::filesystem::current_path(), systemClock(), currentUserName());
}

uint64_t WorkspaceContext::now() const {
    if (!clock) {
        return systemClock()();
    }
    return clock();
}

std::filesystem::path WorkspaceContext::resolve(const std::string& name) const {
    return working_directory / name;
}

EpochClock WorkspaceContext::systemClock() {
    return []() {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
    };
}

EpochClock WorkspaceContext::fixedClock(uint64_t seconds) {
    return [seconds]() { return seconds; };
}

std::string WorkspaceContext::currentUserName() {
    for (const char* var : {"USER", "USERNAME", "LOGNAME"}) {
        const char* value = std::getenv(var);
        if (value != nullptr && *value != '\0') {
            return value;
        }
    }

#if !defined(_WIN32)
    if (const passwd* pw = getpwuid(geteuid())) {
        if (pw->pw_name != nullptr) {
            return pw->pw_name;
        }
    }
#endif

    return "unknown";
}

} // namespace SafeBackup
