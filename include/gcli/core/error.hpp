#pragma once

#include <string>
#include <utility>

namespace gcli {

/**
 * @brief Failure categories surfaced to the top-level dispatch point
 *
 * Retryable is a signal rather than a failure: a remote job is pending or was
 * just queued, and re-running the same command later may succeed.
 */
enum class ErrorKind {
    NotFound,        // Reference, archive or vault does not resolve
    DataError,       // Malformed data, local I/O failure
    Retryable,       // Job pending or just submitted
    Usage,           // Self-contradictory or invalid invocation
    Integrity,       // Tree hash mismatch
    Timeout,         // Poll budget exhausted
    Remote,          // Service or transport failure
    SeekPastWindow,  // Windowed reader asked to move beyond its end
    Unsupported      // Operation not offered in this role
};

struct Error {
    ErrorKind kind = ErrorKind::DataError;
    std::string message;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::DataError: return "data error";
        case ErrorKind::Retryable: return "retryable";
        case ErrorKind::Usage: return "usage error";
        case ErrorKind::Integrity: return "integrity failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Remote: return "remote error";
        case ErrorKind::SeekPastWindow: return "seek past window end";
        case ErrorKind::Unsupported: return "unsupported";
    }
    return "unknown";
}

} // namespace gcli
