#pragma once

#include <stdexcept>
#include <string>

/// Failure classes reported by the display API
enum class ErrorKind {
    TransportUnavailable,  // device could not be opened
    TransportIo,           // write or read failed at the transport level
    Timeout,               // no response within the read timeout
    InvalidCommand,        // firmware rejected the command code
    ChecksumMismatch,      // firmware CRC disagreed with the frame CRC
    ProtocolViolation,     // response too short to hold a status word
};

const char* error_kind_name(ErrorKind kind);

/// Base of every exception thrown by the display API
class GliderError : public std::runtime_error {
public:
    GliderError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class TransportUnavailableError : public GliderError {
public:
    explicit TransportUnavailableError(const std::string& message)
        : GliderError(ErrorKind::TransportUnavailable, message) {}
};

class TransportIoError : public GliderError {
public:
    explicit TransportIoError(const std::string& message)
        : GliderError(ErrorKind::TransportIo, message) {}
};

class TimeoutError : public GliderError {
public:
    explicit TimeoutError(const std::string& message)
        : GliderError(ErrorKind::Timeout, message) {}
};

class InvalidCommandError : public GliderError {
public:
    explicit InvalidCommandError(const std::string& message)
        : GliderError(ErrorKind::InvalidCommand, message) {}
};

class ChecksumMismatchError : public GliderError {
public:
    explicit ChecksumMismatchError(const std::string& message)
        : GliderError(ErrorKind::ChecksumMismatch, message) {}
};

class ProtocolViolationError : public GliderError {
public:
    explicit ProtocolViolationError(const std::string& message)
        : GliderError(ErrorKind::ProtocolViolation, message) {}
};
