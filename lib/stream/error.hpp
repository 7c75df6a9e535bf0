// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

namespace obj_transport {

/// Error codes for all transport operations.
enum class ErrorCode {
    // Connection
    ConnectionFailed,      ///< connect/write/read failed (ECONNREFUSED, EPIPE, etc.)
    ConnectionClosed,      ///< Remote peer closed the connection
    DnsResolutionFailed,   ///< Hostname could not be resolved

    // Protocol
    FramingError,          ///< Malformed length prefix, header body or truncated frame
    FrameTooLarge,         ///< Length prefix exceeds the configured maximum
    ProtocolError,         ///< Malformed request head or unexpected response
    BufferOverflow,        ///< Internal buffer exceeded size limit

    // Compression
    CompressionError,      ///< zstd compression failed
    DecompressionError,    ///< zstd decompression failed or block is malformed

    // Routing
    RouteNotFound,         ///< No handler registered for the request path
    DuplicateRoute,        ///< (network, transport name) already registered
    InvalidRoute,          ///< Empty name or name containing '/'

    // Payload
    PayloadReadFailed,     ///< Payload source returned an error
    PayloadSizeMismatch,   ///< Payload source length differs from header size

    // State
    InvalidState,          ///< Stream does not accept the operation in its current state
    Cancelled,             ///< Stream was stopped before the request completed
};

/// Error payload delivered to completion callbacks and returned by
/// synchronous operations.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "connection", "protocol").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::DnsResolutionFailed:
            return "connection";
        case ErrorCode::FramingError:
        case ErrorCode::FrameTooLarge:
        case ErrorCode::ProtocolError:
        case ErrorCode::BufferOverflow:
            return "protocol";
        case ErrorCode::CompressionError:
        case ErrorCode::DecompressionError:
            return "compression";
        case ErrorCode::RouteNotFound:
        case ErrorCode::DuplicateRoute:
        case ErrorCode::InvalidRoute:
            return "routing";
        case ErrorCode::PayloadReadFailed:
        case ErrorCode::PayloadSizeMismatch:
            return "payload";
        case ErrorCode::InvalidState:
        case ErrorCode::Cancelled:
            return "state";
    }
    return "unknown";
}

/// Return the enumerator name of an error code, used in log lines.
constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::DnsResolutionFailed: return "DnsResolutionFailed";
        case ErrorCode::FramingError: return "FramingError";
        case ErrorCode::FrameTooLarge: return "FrameTooLarge";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::BufferOverflow: return "BufferOverflow";
        case ErrorCode::CompressionError: return "CompressionError";
        case ErrorCode::DecompressionError: return "DecompressionError";
        case ErrorCode::RouteNotFound: return "RouteNotFound";
        case ErrorCode::DuplicateRoute: return "DuplicateRoute";
        case ErrorCode::InvalidRoute: return "InvalidRoute";
        case ErrorCode::PayloadReadFailed: return "PayloadReadFailed";
        case ErrorCode::PayloadSizeMismatch: return "PayloadSizeMismatch";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

}  // namespace obj_transport

template <>
struct fmt::formatter<obj_transport::Error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const obj_transport::Error& e, FormatContext& ctx) const {
        if (e.os_errno != 0) {
            return fmt::format_to(ctx.out(), "{}: {} (errno {})",
                                  obj_transport::error_name(e.code), e.message,
                                  e.os_errno);
        }
        return fmt::format_to(ctx.out(), "{}: {}",
                              obj_transport::error_name(e.code), e.message);
    }
};
