#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy shared by the edit engine and the job manager.
 *
 * Engines throw CortexError; the tool layer catches it and turns it into an
 * {"error": "..."} result, so nothing below ever reaches the RPC channel raw.
 */
enum class ErrorKind {
    NotFound,
    PermissionDenied,
    ParseUnavailable,   // no primary grammar; selects the heuristic path, never surfaced
    ValidationFailed,
    SpawnFailed,
    Timeout,
    IoError,
    InvalidEdit
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::ParseUnavailable: return "ParseUnavailable";
        case ErrorKind::ValidationFailed: return "ValidationFailed";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::InvalidEdit: return "InvalidEdit";
    }
    return "Unknown";
}

class CortexError : public std::runtime_error {
public:
    CortexError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};
