// =================================================================
// include/SafeBackup/InteractiveSession.hpp
// =================================================================
// Prompt loop reading a file name and a command until exit.

#pragma once

#include <iostream>
#include <string>

namespace SafeBackup {

class BackupManager;

/**
 * @brief Commands accepted at the command prompt
 */
enum class SessionCommand {
    BACKUP,
    RESTORE,
    DELETE,
    LIST,
    EXIT,
    UNKNOWN
};

/**
 * @brief Interactive front end over a BackupManager
 *
 * Asks for a file name, then for a command, and prints the outcome. Errors
 * are reported and the loop continues; only "exit"/"quit" (any case) or
 * end of input stop it.
 */
class InteractiveSession {
public:
    /**
     * @brief Construct a new InteractiveSession
     * @param manager Operations to dispatch to
     * @param in Input stream (prompts are answered line by line)
     * @param out Stream for prompts and results
     * @param err Stream for error messages
     */
    InteractiveSession(BackupManager& manager,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout,
                       std::ostream& err = std::cerr);

    /**
     * @brief Run until exit or end of input
     * @return Number of operations that failed
     */
    int run();

    /**
     * @brief Map user input to a command (case-insensitive, trimmed)
     */
    static SessionCommand parseCommand(const std::string& input);

    /**
     * @brief Whether input is "exit" or "quit" in any case
     */
    static bool isExitRequest(const std::string& input);

private:
    BackupManager& m_manager;
    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;

    /**
     * @brief Print a prompt and read one trimmed line
     * @return False at end of input
     */
    bool prompt(const std::string& text, std::string& answer);

    /**
     * @brief Execute one command against a validated file name
     * @return True on success
     */
    bool dispatch(SessionCommand command, const std::string& file_name, const std::string& raw_command);
};

} // namespace SafeBackup
