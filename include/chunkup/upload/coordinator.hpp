#pragma once

#include "chunkup/core/cancellation.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/notify/progress_notifier.hpp"
#include "chunkup/notify/push_channel.hpp"
#include "chunkup/upload/chunk_source.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/session_store.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkup::upload {

/**
 * @brief Owns the UploadSession state machine
 *
 *   Initialized --upload--> Uploading --all acked--> Finalizing --> Completed
 *   Initialized/Uploading --interrupt or resume--> Resuming
 *   Resuming --residual work--> Uploading
 *   Resuming --nothing missing--> Finalizing
 *   any non-terminal --cancel--> Cancelled
 *   any non-terminal --fatal error--> Failed
 *
 * upload() and resume() run synchronously in the calling thread, with the
 * chunk transmissions on the scheduler's worker pool. At most one run per
 * session is active; cancel() and interrupt() may be called from any
 * thread, including a progress callback.
 *
 * Every state change is written through to the SessionStore so a journal,
 * if configured, always reflects the last known progress.
 *
 * With a channel connector set, each run forwards server progress onto the
 * bus. If the push channel cannot be opened or is lost mid-run, the run
 * falls back to polling the session status instead.
 */
class SessionCoordinator {
public:
    SessionCoordinator(UploadApi& api, SessionStore& store, events::EventBus& bus);

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    /// Attach a push channel to every subsequent run
    void set_channel_connector(notify::ChannelConnector connector);

    void set_notifier_options(notify::ProgressNotifier::Options options) { notifier_options_ = options; }

    Result<std::shared_ptr<UploadSession>> initialize(
        const FileDescriptor& file,
        std::shared_ptr<const ByteSource> bytes,
        const UploadOptions& options,
        std::optional<std::filesystem::path> source_path = std::nullopt);

    /// Describe @p path (name, size, SHA-256 hash) and initialize a session for it
    Result<std::shared_ptr<UploadSession>> initialize_file(const std::filesystem::path& path,
                                                           const UploadOptions& options);

    Result<FinalizeResult> upload(const std::string& session_id, const ProgressCallback& on_progress = {});

    /**
     * Reconcile with the server, then upload what it lacks and finalize.
     *
     * Only non-terminal sessions resume. A session that failed locally stays
     * Failed even if the server still reports it active: resume() returns
     * InvalidState and the caller must initialize a new session.
     */
    Result<FinalizeResult> resume(const std::string& session_id, const ProgressCallback& on_progress = {});

    /// Stop dispatch, mark Cancelled, ask the server to drop the session
    Result<void> cancel(const std::string& session_id);

    /// Stop the active run and leave the session Resuming
    Result<void> interrupt(const std::string& session_id);

    bool evict(const std::string& session_id);

    Result<std::shared_ptr<UploadSession>> find(const std::string& session_id);

    [[nodiscard]] bool is_running(const std::string& session_id) const;

private:
    Result<std::shared_ptr<CancellationToken>> begin_run(const std::string& session_id);
    void end_run(const std::string& session_id);

    Result<void> transition(const SessionEntry& entry, UploadStatus next);
    void persist(const SessionEntry& entry);

    Result<FinalizeResult> drive(const SessionEntry& entry,
                                 std::vector<ChunkIndex> pending,
                                 const ProgressCallback& on_progress,
                                 const CancellationToken& token);
    Result<FinalizeResult> finish(const SessionEntry& entry, const CancellationToken& token);
    Result<FinalizeResult> fail(const SessionEntry& entry, const Error& error);
    Result<FinalizeResult> stopped(const SessionEntry& entry, const CancellationToken& token);

    std::unique_ptr<notify::ProgressNotifier> open_notifier(const std::string& session_id);

    UploadApi& api_;
    SessionStore& store_;
    events::EventBus& bus_;
    notify::ChannelConnector connector_;
    notify::ProgressNotifier::Options notifier_options_;

    mutable std::mutex runs_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> runs_;
};

} // namespace chunkup::upload
