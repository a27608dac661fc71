#pragma once

#include "chunkup/notify/push_channel.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace chunkup::upload {

/**
 * @brief Push channel synthesized from periodic status queries
 *
 * Each receive() asks the server for the session status once and turns what
 * changed since the previous call into progress events: an ack for every
 * newly held chunk, then assembly started/completed/failed as the remote
 * state moves. Sequence numbers continue from @p last_sequence. When nothing
 * changed, receive() waits out @p wait before returning an empty batch.
 *
 * Read only: it reports the server's view and never touches a session.
 */
class StatusPollingChannel : public notify::PushChannel {
public:
    StatusPollingChannel(UploadApi& api, std::string session_id, std::uint64_t last_sequence = 0)
        : api_(api), session_id_(std::move(session_id)), sequence_(last_sequence) {}

    Result<std::vector<notify::ProgressEvent>> receive(std::chrono::milliseconds wait) override;

    void close() override { closed_ = true; }

private:
    notify::ProgressEvent next(notify::ProgressEventType type);

    UploadApi& api_;
    std::string session_id_;
    std::uint64_t sequence_;
    std::set<ChunkIndex> seen_;
    bool started_ = false;
    bool finished_ = false;
    bool closed_ = false;
};

} // namespace chunkup::upload
