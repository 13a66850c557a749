// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace chunk_pipe {

/// Error codes for pipeline and decoder operations.
///
/// Running out of buffered input is not an error: it is reported by the
/// Suspension exception and handled by the scheduler loop.
enum class ErrorCode {
    // Decoding
    DecompressionError,    ///< Zstd decompression failed (corrupt or unsupported frame)

    // Resources
    BufferOverflow,        ///< A decoded unit or its input exceeded the configured limit

    // Stream
    TruncatedInput,        ///< Upstream finished while a decoder unit was still incomplete

    // State
    InvalidState,          ///< Method called in wrong stage state
};

/// Error payload delivered to OnError callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "decompression", "stream").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::DecompressionError:
            return "decompression";
        case ErrorCode::BufferOverflow:
            return "resource";
        case ErrorCode::TruncatedInput:
            return "stream";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

}  // namespace chunk_pipe
