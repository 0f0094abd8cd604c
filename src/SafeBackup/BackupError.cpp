// =================================================================
// src/SafeBackup/BackupError.cpp
// =================================================================

#include "SafeBackup/BackupError.hpp"

namespace SafeBackup {

std::string getErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT: return "invalid input";
        case ErrorKind::NOT_FOUND: return "not found";
        case ErrorKind::IO_FAILURE: return "I/O error";
        default: return "unknown error";
    }
}

} // namespace SafeBackup
