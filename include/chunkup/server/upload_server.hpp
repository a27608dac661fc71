#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/notify/push_channel.hpp"
#include "chunkup/server/chunk_staging.hpp"
#include "chunkup/server/server_error.hpp"
#include "chunkup/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::server {

struct ServerOptions {
    std::filesystem::path staging_root = "upload_data/staging";
    std::filesystem::path artifact_root = "upload_data/artifacts";
    std::uint64_t chunk_size = 1024 * 1024;
    std::uint64_t max_file_size = 1024ULL * 1024 * 1024;
    std::chrono::seconds session_ttl{24 * 60 * 60};
    bool accept_chunk_size_hint = true;          ///< Use the client's chunk_size when within bounds
    std::uint64_t min_chunk_size = 1;
    std::uint64_t max_chunk_size = 64 * 1024 * 1024;
    std::size_t max_events_per_poll = 256;
};

struct ServerMetrics {
    std::map<std::string, std::size_t> sessions_by_state;
    std::uint64_t chunks_accepted = 0;
    std::uint64_t duplicate_chunks = 0;
    std::uint64_t bytes_received = 0;
    std::uint64_t artifacts_assembled = 0;
};

using ClockFn = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Reference implementation of the chunked upload server contract
 *
 * Sessions live in memory; chunk bytes go to a ChunkStaging area and the
 * assembled file to <artifact_root>/<artifact_id>/<file name>.
 *
 * LOCKING:
 * Each session has a gate (shared_mutex) and a state mutex. Chunk
 * acceptance holds the gate shared, so chunks of one session are written
 * in parallel; finalize and cancel hold it exclusively, so assembly never
 * overlaps a chunk write. The state mutex guards the accepted set, state
 * and event log.
 *
 * The clock is injectable so tests can move past the session TTL.
 */
class UploadServer {
public:
    UploadServer(ServerOptions options, events::EventBus& bus, ClockFn clock = {});

    UploadServer(const UploadServer&) = delete;
    UploadServer& operator=(const UploadServer&) = delete;

    ServerResult<upload::InitializeResponse> initialize(const upload::InitializeRequest& request);

    ServerResult<upload::PutChunkResponse> accept_chunk(const std::string& session_id,
                                                        std::uint32_t index,
                                                        const std::vector<std::uint8_t>& data);

    ServerResult<upload::RemoteStatus> status(const std::string& session_id);

    /// Idempotent: a completed session returns its recorded artifact
    ServerResult<upload::FinalizeResult> finalize(const std::string& session_id);

    ServerResult<void> cancel(const std::string& session_id);

    /**
     * @brief Events with sequence > @p after, waiting up to @p wait for one
     */
    ServerResult<std::vector<notify::ProgressEvent>> events_after(const std::string& session_id,
                                                                 std::uint64_t after,
                                                                 std::chrono::milliseconds wait);

    /**
     * @brief Expire sessions past their TTL and drop their staged chunks
     * @return Number of sessions expired or removed by this sweep
     */
    std::size_t sweep();

    [[nodiscard]] ServerMetrics metrics() const;

    [[nodiscard]] std::optional<std::filesystem::path> artifact_path(const std::string& artifact_id) const;

    [[nodiscard]] const ServerOptions& options() const noexcept { return options_; }

private:
    struct SessionRecord {
        std::string id;
        upload::FileDescriptor file;
        std::uint64_t chunk_size = 0;
        std::uint32_t total_chunks = 0;
        std::map<std::string, std::string> client_options;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point expires_at{};

        std::shared_mutex gate;
        std::mutex mutex;
        std::condition_variable events_cv;
        upload::RemoteSessionState state = upload::RemoteSessionState::Active;
        std::set<std::uint32_t> accepted;
        std::optional<upload::FinalizeResult> result;
        std::vector<notify::ProgressEvent> events;
    };
    using RecordPtr = std::shared_ptr<SessionRecord>;

    ServerResult<RecordPtr> find_session(const std::string& session_id) const;

    /// Flip an overdue Active session to Expired; caller holds record.mutex
    bool expire_if_due(SessionRecord& record, std::chrono::system_clock::time_point now);

    /// Append to the event log; caller holds record.mutex
    void record_event(SessionRecord& record, notify::ProgressEvent event);

    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    ServerOptions options_;
    events::EventBus& event_bus_;
    ClockFn clock_;
    ChunkStaging staging_;

    std::atomic<std::uint64_t> session_counter_{0};
    std::atomic<std::uint64_t> artifact_counter_{0};
    std::atomic<std::uint64_t> chunks_accepted_{0};
    std::atomic<std::uint64_t> duplicate_chunks_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
    std::atomic<std::uint64_t> artifacts_assembled_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RecordPtr> sessions_;
    std::unordered_map<std::string, std::filesystem::path> artifacts_;
};

} // namespace chunkup::server
