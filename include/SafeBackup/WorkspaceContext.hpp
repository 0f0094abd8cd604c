// =================================================================
// include/SafeBackup/WorkspaceContext.hpp
// =================================================================
// Working directory, clock and acting user passed to every component.

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace SafeBackup {

/**
 * @brief Source of Unix-epoch seconds
 */
using EpochClock = std::function<uint64_t()>;

/**
 * @brief Ambient state an operation runs against
 *
 * Validators, resolvers and loggers read the working directory, the
 * current time and the user name from here instead of the process, so
 * tests can pin all three.
 */
struct WorkspaceContext {
    std::filesystem::path working_directory;  ///< Directory all names resolve against
    EpochClock clock;                         ///< Returns current Unix-epoch seconds
    std::string user_name;                    ///< Acting user written to the activity log

    WorkspaceContext() = default;
    WorkspaceContext(std::filesystem::path dir, EpochClock clk, std::string user)
        : working_directory(std::move(dir)), clock(std::move(clk)), user_name(std::move(user)) {}

    /**
     * @brief Capture current directory, system clock and login name
     * @return Context describing the running process
     */
    static WorkspaceContext fromProcess();

    /**
     * @brief Current time in Unix-epoch seconds
     */
    uint64_t now() const;

    /**
     * @brief Join a name onto the working directory (no canonicalization)
     * @param name Relative file name
     * @return working_directory / name
     */
    std::filesystem::path resolve(const std::string& name) const;

    /**
     * @brief Clock backed by std::chrono::system_clock
     */
    static EpochClock systemClock();

    /**
     * @brief Clock that always returns the same instant
     * @param seconds Fixed Unix-epoch seconds
     */
    static EpochClock fixedClock(uint64_t seconds);

    /**
     * @brief Look up the acting user from the environment
     * @return User name, or "unknown" if none can be determined
     */
    static std::string currentUserName();
};

} // namespace SafeBackup
