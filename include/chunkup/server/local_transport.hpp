#pragma once

#include "chunkup/notify/push_channel.hpp"
#include "chunkup/server/upload_server.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace chunkup::server {

/**
 * @brief UploadApi that calls an in-process UploadServer directly
 *
 * Used by tests and by embedding applications that host the server
 * themselves. The per-attempt timeout is not enforced.
 */
class LocalUploadApi : public upload::UploadApi {
public:
    explicit LocalUploadApi(UploadServer& server) : server_(server) {}

    Result<upload::InitializeResponse> initialize(const upload::InitializeRequest& request) override;

    Result<upload::PutChunkResponse> put_chunk(const std::string& session_id,
                                               upload::ChunkIndex index,
                                               const std::vector<std::uint8_t>& payload,
                                               std::chrono::milliseconds timeout) override;

    Result<upload::RemoteStatus> status(const std::string& session_id) override;

    Result<upload::FinalizeResult> finalize(const std::string& session_id) override;

    Result<void> cancel(const std::string& session_id) override;

private:
    UploadServer& server_;
};

/// Push channel reading a session's event log from an in-process server
class LocalPushChannel : public notify::PushChannel {
public:
    LocalPushChannel(UploadServer& server, std::string session_id)
        : server_(server), session_id_(std::move(session_id)) {}

    Result<std::vector<notify::ProgressEvent>> receive(std::chrono::milliseconds wait) override;

    void close() override { closed_ = true; }

private:
    UploadServer& server_;
    std::string session_id_;
    std::uint64_t cursor_ = 0;
    bool closed_ = false;
};

notify::ChannelConnector local_channel_connector(UploadServer& server);

} // namespace chunkup::server
