#pragma once

#include "chunkup/network/http_client.hpp"
#include "chunkup/notify/push_channel.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup {
namespace network {

/**
 * @brief UploadApi speaking the JSON/HTTP protocol of chunkup_server
 *
 * Status mapping:
 *   2xx          decoded body (ProtocolError if it does not decode)
 *   404, 410     SessionExpired
 *   other 4xx    Rejected
 *   500 with code "assembly_failed"  AssemblyFailed
 *   other 5xx, network failure, timeout  Transient
 */
class HttpUploadApi : public upload::UploadApi {
public:
    explicit HttpUploadApi(Endpoint endpoint,
                           std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000))
        : client_(std::move(endpoint)), request_timeout_(request_timeout) {}

    Result<upload::InitializeResponse> initialize(const upload::InitializeRequest& request) override;

    Result<upload::PutChunkResponse> put_chunk(const std::string& session_id,
                                               upload::ChunkIndex index,
                                               const std::vector<std::uint8_t>& payload,
                                               std::chrono::milliseconds timeout) override;

    Result<upload::RemoteStatus> status(const std::string& session_id) override;

    Result<upload::FinalizeResult> finalize(const std::string& session_id) override;

    Result<void> cancel(const std::string& session_id) override;

    const HttpClient& client() const { return client_; }

private:
    HttpClient client_;
    std::chrono::milliseconds request_timeout_;
};

/// Translate a non-2xx response into the client error taxonomy
Error error_from_response(const HttpResponse& response);

/**
 * @brief Push channel backed by long-polling the events endpoint
 *
 * Each receive() asks for events after the highest sequence seen so far
 * and lets the server hold the request for up to the requested wait.
 */
class HttpPollingChannel : public notify::PushChannel {
public:
    HttpPollingChannel(Endpoint endpoint, std::string session_id)
        : client_(std::move(endpoint)), session_id_(std::move(session_id)) {}

    Result<std::vector<notify::ProgressEvent>> receive(std::chrono::milliseconds wait) override;

    void close() override { closed_ = true; }

private:
    HttpClient client_;
    std::string session_id_;
    std::uint64_t cursor_ = 0;
    bool closed_ = false;
};

notify::ChannelConnector http_channel_connector(Endpoint endpoint);

} // namespace network
} // namespace chunkup
