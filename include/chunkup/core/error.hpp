#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chunkup {

/**
 * @brief Failure taxonomy shared by the client, transports and reference server
 *
 * The first five codes are the session-level contract. The rest describe
 * transport and local failures that the upload components translate into
 * one of the session-level codes before they reach the caller.
 */
enum class ErrorCode {
    InitializationFailed,  // Server refused to create the session
    ChunkTransientError,   // One chunk attempt failed, retry allowed
    ChunkPermanentError,   // Chunk gave up (attempt cap or non-retryable rejection)
    SessionExpired,        // Server no longer knows the session
    InvalidState,          // Operation incompatible with the session state

    Transient,             // Network error, timeout or 5xx
    Rejected,              // Non-retryable 4xx
    ProtocolError,         // Malformed or inconsistent server reply
    IoError,               // Local file access failed
    AssemblyFailed,        // Server could not assemble the artifact
    Cancelled,             // Session cancelled by the caller
    Interrupted            // Run stopped by an explicit interruption
};

struct Error {
    ErrorCode code = ErrorCode::ProtocolError;
    std::string message;
    std::optional<std::uint32_t> chunk_index;  ///< Set for chunk-scoped failures
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InitializationFailed: return "InitializationFailed";
        case ErrorCode::ChunkTransientError: return "ChunkTransientError";
        case ErrorCode::ChunkPermanentError: return "ChunkPermanentError";
        case ErrorCode::SessionExpired: return "SessionExpired";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Transient: return "Transient";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::AssemblyFailed: return "AssemblyFailed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

inline std::optional<ErrorCode> error_code_from_string(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::InitializationFailed, ErrorCode::ChunkTransientError,
        ErrorCode::ChunkPermanentError, ErrorCode::SessionExpired,
        ErrorCode::InvalidState, ErrorCode::Transient, ErrorCode::Rejected,
        ErrorCode::ProtocolError, ErrorCode::IoError, ErrorCode::AssemblyFailed,
        ErrorCode::Cancelled, ErrorCode::Interrupted,
    };
    for (auto code : all) {
        if (name == to_string(code)) {
            return code;
        }
    }
    return std::nullopt;
}

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message), std::nullopt};
}

inline Error make_chunk_error(ErrorCode code, std::uint32_t chunk_index, std::string message) {
    return Error{code, std::move(message), chunk_index};
}

/// Worth another attempt against the same endpoint
inline bool is_transient(const Error& error) noexcept {
    return error.code == ErrorCode::Transient || error.code == ErrorCode::ChunkTransientError;
}

inline std::string describe(const Error& error) {
    std::string text = to_string(error.code);
    if (error.chunk_index) {
        text += " (chunk " + std::to_string(*error.chunk_index) + ")";
    }
    if (!error.message.empty()) {
        text += ": " + error.message;
    }
    return text;
}

} // namespace chunkup
