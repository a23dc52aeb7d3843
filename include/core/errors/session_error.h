/**
 * @file session_error.h
 * @brief Error taxonomy for the progress stream and upload session.
 */

#pragma once

#include <optional>
#include <string>

namespace uploadwatch {

enum class ErrorKind {
    ConnectTimeout,
    TransportError,
    ProtocolError,
    ReconnectExhausted,
    ConflictError,
    MalformedFrame
};

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectTimeout: return "CONNECT_TIMEOUT";
        case ErrorKind::TransportError: return "TRANSPORT_ERROR";
        case ErrorKind::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorKind::ReconnectExhausted: return "RECONNECT_EXHAUSTED";
        case ErrorKind::ConflictError: return "CONFLICT_ERROR";
        case ErrorKind::MalformedFrame: return "MALFORMED_FRAME";
        default: return "UNKNOWN";
    }
}

struct SessionError {
    ErrorKind kind{ErrorKind::TransportError};
    std::string message;
    // For ReconnectExhausted: what ended the last attempt.
    std::optional<ErrorKind> cause;
};

} // namespace uploadwatch
