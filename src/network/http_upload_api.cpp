#include "chunkup/network/http_upload_api.hpp"

#include "chunkup/server/server_error.hpp"
#include "chunkup/upload/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace chunkup {
namespace network {

using json = nlohmann::json;

Error error_from_response(const HttpResponse& response) {
    auto body = json::parse(response.body_as_string(), nullptr, false);

    std::string message = "HTTP " + std::to_string(response.status_code);
    std::string code;
    if (!body.is_discarded() && body.is_object()) {
        message = body.value("error", message);
        code = body.value("code", "");
    }

    server::ServerErrorCode server_code;
    switch (response.status_code) {
        case 404: server_code = server::ServerErrorCode::NotFound; break;
        case 410: server_code = server::ServerErrorCode::Gone; break;
        case 409: server_code = server::ServerErrorCode::Conflict; break;
        case 413: server_code = server::ServerErrorCode::TooLarge; break;
        default:
            if (response.status_code >= 500) {
                server_code = code == "assembly_failed" ? server::ServerErrorCode::AssemblyFailed
                                                        : server::ServerErrorCode::Internal;
            } else {
                server_code = server::ServerErrorCode::BadRequest;
            }
            break;
    }
    return server::to_client_error(server::ServerError{server_code, message, {}});
}

namespace {

/// Shared tail of every call: transport error, HTTP error, or decode the body
template<typename T, typename Decode>
Result<T> handle(Result<HttpResponse> response, Decode&& decode) {
    if (response.is_error()) {
        return Err<T>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<T>(error_from_response(reply));
    }
    auto body = json::parse(reply.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Fail<T>(ErrorCode::ProtocolError, "Server reply is not valid JSON");
    }
    return decode(body);
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

Result<upload::InitializeResponse> HttpUploadApi::initialize(const upload::InitializeRequest& request) {
    auto body = upload::initialize_request_to_json(request).dump();
    return handle<upload::InitializeResponse>(
        client_.post("/uploads/initialize", to_bytes(body), "application/json", request_timeout_),
        upload::initialize_response_from_json);
}

Result<upload::PutChunkResponse> HttpUploadApi::put_chunk(const std::string& session_id,
                                                          upload::ChunkIndex index,
                                                          const std::vector<std::uint8_t>& payload,
                                                          std::chrono::milliseconds timeout) {
    return handle<upload::PutChunkResponse>(
        client_.post("/uploads/" + session_id + "/chunks/" + std::to_string(index),
                     payload, "application/octet-stream", timeout),
        upload::put_chunk_response_from_json);
}

Result<upload::RemoteStatus> HttpUploadApi::status(const std::string& session_id) {
    return handle<upload::RemoteStatus>(
        client_.get("/uploads/" + session_id + "/status", request_timeout_),
        upload::remote_status_from_json);
}

Result<upload::FinalizeResult> HttpUploadApi::finalize(const std::string& session_id) {
    return handle<upload::FinalizeResult>(
        client_.post("/uploads/" + session_id + "/finalize", {}, "application/json", request_timeout_),
        upload::finalize_result_from_json);
}

Result<void> HttpUploadApi::cancel(const std::string& session_id) {
    auto response = client_.delete_("/uploads/" + session_id, request_timeout_);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<void>(error_from_response(response.value()));
    }
    return Ok();
}

Result<std::vector<notify::ProgressEvent>> HttpPollingChannel::receive(std::chrono::milliseconds wait) {
    using Events = std::vector<notify::ProgressEvent>;

    if (closed_) {
        return Fail<Events>(ErrorCode::InvalidState, "Channel closed");
    }

    std::string url = "/uploads/" + session_id_ + "/events?after=" + std::to_string(cursor_) +
                      "&wait_ms=" + std::to_string(wait.count());
    auto batch = handle<Events>(
        client_.get(url, wait + std::chrono::milliseconds(5000)),
        [this](const json& body) -> Result<Events> {
            if (!body.is_object() || !body.contains("events") || !body["events"].is_array()) {
                return Fail<Events>(ErrorCode::ProtocolError, "Events reply has no events array");
            }
            Events events;
            for (const auto& item : body["events"]) {
                auto event = notify::progress_event_from_json(item);
                if (event.is_error()) {
                    return Err<Events>(event.error());
                }
                events.push_back(std::move(event.value()));
            }
            return Ok(std::move(events));
        });

    if (batch.is_ok()) {
        for (const auto& event : batch.value()) {
            cursor_ = std::max(cursor_, event.sequence);
        }
    }
    return batch;
}

notify::ChannelConnector http_channel_connector(Endpoint endpoint) {
    return [endpoint](const std::string& session_id) -> Result<std::unique_ptr<notify::PushChannel>> {
        return Ok<std::unique_ptr<notify::PushChannel>>(
            std::make_unique<HttpPollingChannel>(endpoint, session_id));
    };
}

} // namespace network
} // namespace chunkup
