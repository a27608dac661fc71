#include "chunkup/server/server_error.hpp"

namespace chunkup::server {

const char* to_string(ServerErrorCode code) {
    switch (code) {
        case ServerErrorCode::BadRequest: return "bad_request";
        case ServerErrorCode::NotFound: return "not_found";
        case ServerErrorCode::Conflict: return "conflict";
        case ServerErrorCode::Gone: return "expired";
        case ServerErrorCode::TooLarge: return "too_large";
        case ServerErrorCode::AssemblyFailed: return "assembly_failed";
        case ServerErrorCode::Internal: return "internal";
    }
    return "internal";
}

ServerErrorCode server_error_code_from_string(const std::string& name) {
    for (auto code : {ServerErrorCode::BadRequest, ServerErrorCode::NotFound, ServerErrorCode::Conflict,
                      ServerErrorCode::Gone, ServerErrorCode::TooLarge, ServerErrorCode::AssemblyFailed}) {
        if (name == to_string(code)) {
            return code;
        }
    }
    return ServerErrorCode::Internal;
}

int http_status_for(ServerErrorCode code) noexcept {
    switch (code) {
        case ServerErrorCode::BadRequest: return 400;
        case ServerErrorCode::NotFound: return 404;
        case ServerErrorCode::Conflict: return 409;
        case ServerErrorCode::Gone: return 410;
        case ServerErrorCode::TooLarge: return 413;
        case ServerErrorCode::AssemblyFailed: return 500;
        case ServerErrorCode::Internal: return 500;
    }
    return 500;
}

Error to_client_error(const ServerError& error) {
    switch (error.code) {
        case ServerErrorCode::NotFound:
        case ServerErrorCode::Gone:
            return make_error(ErrorCode::SessionExpired, error.message);
        case ServerErrorCode::AssemblyFailed:
            return make_error(ErrorCode::AssemblyFailed, error.message);
        case ServerErrorCode::Internal:
            return make_error(ErrorCode::Transient, error.message);
        case ServerErrorCode::BadRequest:
        case ServerErrorCode::Conflict:
        case ServerErrorCode::TooLarge:
            break;
    }
    return make_error(ErrorCode::Rejected, error.message);
}

} // namespace chunkup::server
