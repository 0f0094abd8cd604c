// =================================================================
// include/SafeBackup/BackupError.hpp
// =================================================================
// Error type raised by every backup, restore and delete operation.

#pragma once

#include <stdexcept>
#include <string>

namespace SafeBackup {

/**
 * @brief Classification of a failed operation
 */
enum class ErrorKind {
    INVALID_INPUT,  ///< Empty, absolute, traversing or unparseable name
    NOT_FOUND,      ///< Missing source file or no backup located
    IO_FAILURE      ///< Copy, remove, read or write failed in the storage layer
};

/**
 * @brief Exception carrying an ErrorKind alongside the message
 */
class BackupError : public std::runtime_error {
public:
    BackupError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief Get human-readable name of an error kind
 * @param kind Error kind
 * @return Short description ("invalid input", "not found", "I/O error")
 */
std::string getErrorKindName(ErrorKind kind);

} // namespace SafeBackup
