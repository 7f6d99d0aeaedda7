#include "glider_error.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransportUnavailable: return "transport unavailable";
        case ErrorKind::TransportIo:          return "transport I/O error";
        case ErrorKind::Timeout:              return "timeout";
        case ErrorKind::InvalidCommand:       return "invalid command";
        case ErrorKind::ChecksumMismatch:     return "checksum incorrect";
        case ErrorKind::ProtocolViolation:    return "protocol violation";
    }
    return "unknown error";
}
