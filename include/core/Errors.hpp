#pragma once

#include <string>
#include <stdexcept>

namespace reeldrop {

enum class ErrorKind {
    None,
    Auth,
    Protocol,
    Transfer,
    Conflict,
    LocalIO,
    Cancelled,
    Internal,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Auth: return "AuthError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Transfer: return "TransferError";
        case ErrorKind::Conflict: return "ConflictError";
        case ErrorKind::LocalIO: return "LocalIOError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Internal: return "InternalError";
        default: return "Unknown";
    }
}

/**
 * Base of every failure raised while moving one file through the upload steps
 */
class UploadError : public std::runtime_error {
public:
    UploadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Token rejected by the server; nothing else in this run can succeed
class AuthError : public UploadError {
public:
    explicit AuthError(const std::string& message) : UploadError(ErrorKind::Auth, message) {}
};

// Response that is not well formed or has an unexpected status
class ProtocolError : public UploadError {
public:
    explicit ProtocolError(const std::string& message) : UploadError(ErrorKind::Protocol, message) {}
};

// Network or I/O interruption while sending file bytes
class TransferError : public UploadError {
public:
    explicit TransferError(const std::string& message) : UploadError(ErrorKind::Transfer, message) {}
};

// Content was already posted
class ConflictError : public UploadError {
public:
    explicit ConflictError(const std::string& message) : UploadError(ErrorKind::Conflict, message) {}
};

// Source file unreadable, still being written, or undeletable
class LocalIOError : public UploadError {
public:
    explicit LocalIOError(const std::string& message) : UploadError(ErrorKind::LocalIO, message) {}
};

class CancelledError : public UploadError {
public:
    explicit CancelledError(const std::string& message) : UploadError(ErrorKind::Cancelled, message) {}
};

// Filesystem notification backend failed; fatal to the process
class WatchError : public std::runtime_error {
public:
    explicit WatchError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace reeldrop
