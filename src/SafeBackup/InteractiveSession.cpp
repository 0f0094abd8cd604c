// =================================================================
// src/SafeBackup/InteractiveSession.cpp
// =================================================================
// Implementation for the interactive prompt loop.

#include "SafeBackup/InteractiveSession.hpp"
#include "SafeBackup/BackupError.hpp"
#include "SafeBackup/BackupManager.hpp"
#include "SafeBackup/PathValidator.hpp"
#include <algorithm>
#include <cctype>

namespace SafeBackup {

namespace {

std::string toLower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input;
}

} // namespace

InteractiveSession::InteractiveSession(BackupManager& manager, std::istream& in,
                                       std::ostream& out, std::ostream& err)
    : m_manager(manager), m_in(in), m_out(out), m_err(err) {
}

int InteractiveSession::run() {
    PathValidator validator(m_manager.getContext());
    int failures = 0;

    while (true) {
        std::string file_name;
        if (!prompt("Please enter your file name: ", file_name) || isExitRequest(file_name)) {
            break;
        }

        std::string reason = validator.checkName(file_name);
        if (!reason.empty()) {
            m_err << "[ERROR] " << getErrorKindName(ErrorKind::INVALID_INPUT) << ": " << reason << std::endl;
            continue;
        }

        std::string command_input;
        if (!prompt("Please enter your command (backup, restore, delete, list): ", command_input)) {
            break;
        }

        SessionCommand command = parseCommand(command_input);
        if (command == SessionCommand::EXIT) {
            break;
        }

        if (!dispatch(command, file_name, command_input)) {
            failures++;
        }
        m_out << std::endl;
    }

    m_out << "Bye." << std::endl;
    return failures;
}

SessionCommand InteractiveSession::parseCommand(const std::string& input) {
    std::string command = toLower(PathValidator::trim(input));

    if (command == "backup") return SessionCommand::BACKUP;
    if (command == "restore") return SessionCommand::RESTORE;
    if (command == "delete") return SessionCommand::DELETE;
    if (command == "list") return SessionCommand::LIST;
    if (command == "exit" || command == "quit") return SessionCommand::EXIT;
    return SessionCommand::UNKNOWN;
}

bool InteractiveSession::isExitRequest(const std::string& input) {
    std::string command = toLower(PathValidator::trim(input));
    return command == "exit" || command == "quit";
}

bool InteractiveSession::prompt(const std::string& text, std::string& answer) {
    m_out << text;
    m_out.flush();

    std::string line;
    if (!std::getline(m_in, line)) {
        m_out << std::endl;
        return false;
    }

    answer = PathValidator::trim(line);
    return true;
}

bool InteractiveSession::dispatch(SessionCommand command, const std::string& file_name,
                                  const std::string& raw_command) {
    try {
        switch (command) {
            case SessionCommand::BACKUP: {
                auto path = m_manager.createBackup(file_name);
                m_out << "Your backup created: " << path.filename().string() << std::endl;
                return true;
            }
            case SessionCommand::RESTORE: {
                auto path = m_manager.restoreFile(file_name);
                m_out << "Your file has been restored: " << path.filename().string() << std::endl;
                return true;
            }
            case SessionCommand::DELETE:
                m_manager.deleteFile(file_name);
                m_out << "Deleted: " << file_name << std::endl;
                return true;

            case SessionCommand::LIST: {
                auto entries = m_manager.listBackups(file_name);
                if (entries.empty()) {
                    m_out << "No backups found for: " << file_name << std::endl;
                }
                for (const auto& entry : entries) {
                    m_out << "  " << entry.path.filename().string()
                          << " (" << entry.file_size << " bytes"
                          << (entry.is_plain ? ", latest copy" : "") << ")" << std::endl;
                }
                return true;
            }
            default:
                m_err << "[ERROR] unknown command: " << raw_command << std::endl;
                return false;
        }
    } catch (const BackupError& e) {
        m_err << "[ERROR] " << getErrorKindName(e.kind()) << ": " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        m_err << "[ERROR] " << e.what() << std::endl;
        return false;
    }
}

} // namespace SafeBackup
