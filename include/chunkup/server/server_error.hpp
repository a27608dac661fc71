#pragma once

#include "chunkup/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::server {

/**
 * @brief Failure classes of the reference server, one per HTTP status class
 */
enum class ServerErrorCode {
    BadRequest,      // 400
    NotFound,        // 404 unknown session
    Conflict,        // 409 finalize while incomplete, chunk while assembling
    Gone,            // 410 expired or cancelled session
    TooLarge,        // 413
    AssemblyFailed,  // 500, permanent
    Internal         // 500, storage trouble; retry may succeed
};

struct ServerError {
    ServerErrorCode code = ServerErrorCode::Internal;
    std::string message;
    std::vector<std::uint32_t> missing_chunks;  ///< Conflict on finalize only
};

/// Machine-readable code carried in HTTP error bodies
const char* to_string(ServerErrorCode code);
ServerErrorCode server_error_code_from_string(const std::string& name);

int http_status_for(ServerErrorCode code) noexcept;

/**
 * @brief Translate a server failure into the client error taxonomy
 *
 * NotFound/Gone -> SessionExpired, AssemblyFailed -> AssemblyFailed,
 * Internal -> Transient, any other 4xx class -> Rejected.
 */
Error to_client_error(const ServerError& error);

template<typename T>
using ServerResult = Result<T, ServerError>;

template<typename T>
ServerResult<T> server_ok(T value) {
    return Ok<T, ServerError>(std::move(value));
}

inline ServerResult<void> server_ok() {
    return Ok<ServerError>();
}

template<typename T>
ServerResult<T> server_fail(ServerErrorCode code, std::string message) {
    return Err<T>(ServerError{code, std::move(message), {}});
}

} // namespace chunkup::server
