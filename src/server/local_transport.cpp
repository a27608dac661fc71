#include "chunkup/server/local_transport.hpp"

#include <algorithm>

namespace chunkup::server {
namespace {

template<typename T>
Result<T> to_client(ServerResult<T> result) {
    if (result.is_error()) {
        return Err<T>(to_client_error(result.error()));
    }
    return Ok(std::move(result.value()));
}

} // namespace

Result<upload::InitializeResponse> LocalUploadApi::initialize(const upload::InitializeRequest& request) {
    return to_client(server_.initialize(request));
}

Result<upload::PutChunkResponse> LocalUploadApi::put_chunk(const std::string& session_id,
                                                           upload::ChunkIndex index,
                                                           const std::vector<std::uint8_t>& payload,
                                                           std::chrono::milliseconds) {
    return to_client(server_.accept_chunk(session_id, index, payload));
}

Result<upload::RemoteStatus> LocalUploadApi::status(const std::string& session_id) {
    return to_client(server_.status(session_id));
}

Result<upload::FinalizeResult> LocalUploadApi::finalize(const std::string& session_id) {
    return to_client(server_.finalize(session_id));
}

Result<void> LocalUploadApi::cancel(const std::string& session_id) {
    auto result = server_.cancel(session_id);
    if (result.is_error()) {
        return Err<void>(to_client_error(result.error()));
    }
    return Ok();
}

Result<std::vector<notify::ProgressEvent>> LocalPushChannel::receive(std::chrono::milliseconds wait) {
    using Events = std::vector<notify::ProgressEvent>;

    if (closed_) {
        return Fail<Events>(ErrorCode::InvalidState, "Channel closed");
    }
    auto batch = server_.events_after(session_id_, cursor_, wait);
    if (batch.is_error()) {
        return Err<Events>(to_client_error(batch.error()));
    }
    for (const auto& event : batch.value()) {
        cursor_ = std::max(cursor_, event.sequence);
    }
    return Ok(std::move(batch.value()));
}

notify::ChannelConnector local_channel_connector(UploadServer& server) {
    return [&server](const std::string& session_id) -> Result<std::unique_ptr<notify::PushChannel>> {
        return Ok<std::unique_ptr<notify::PushChannel>>(std::make_unique<LocalPushChannel>(server, session_id));
    };
}

} // namespace chunkup::server
