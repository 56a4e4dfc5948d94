#pragma once

#include <string>
#include <utility>

namespace lft {

/**
 * @brief Failure categories for a transfer session
 *
 * Every category is terminal for the session that raised it. Nothing in the
 * engine retries; a new transfer has to be started by the caller.
 */
enum class ErrorCode {
    MalformedFrame,        ///< Structural violation while decoding a frame
    SizeMismatch,          ///< A file's byte count differs from its declared size
    VerificationMismatch,  ///< Folder totals disagree at handshake time
    IOFailure,             ///< Filesystem or socket failure
    ConnectionClosed,      ///< Peer closed the stream (IOFailure flavour)
    Timeout,               ///< Deadline expired while waiting on the peer
    ProtocolViolation,     ///< Well-formed frame that is illegal in the current phase
    InvalidPath,           ///< Wire path rejected by the receiver
    Cancelled,             ///< Local user abort
    InvalidArgument        ///< Bad request or configuration
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedFrame: return "MalformedFrame";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
        case ErrorCode::VerificationMismatch: return "VerificationMismatch";
        case ErrorCode::IOFailure: return "IOFailure";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::InvalidPath: return "InvalidPath";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::IOFailure;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// "<Code>: <message>", used for logs and user-facing reports
    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

} // namespace lft
