#include "chunkup/upload/coordinator.hpp"
#include "chunkup/core/hash.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/notify/progress_notifier.hpp"
#include "chunkup/upload/chunk_scheduler.hpp"
#include "chunkup/upload/finalizer.hpp"
#include "chunkup/upload/resume_reconciler.hpp"
#include "chunkup/upload/status_polling_channel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace chunkup::upload {
namespace {

/// Stops the run's notifier, then releases the run slot
class RunScope {
public:
    RunScope(std::function<void()> on_exit, std::unique_ptr<notify::ProgressNotifier> notifier)
        : on_exit_(std::move(on_exit)), notifier_(std::move(notifier)) {}

    ~RunScope() {
        if (notifier_) {
            notifier_->stop();
        }
        on_exit_();
    }

    RunScope(const RunScope&) = delete;
    RunScope& operator=(const RunScope&) = delete;

private:
    std::function<void()> on_exit_;
    std::unique_ptr<notify::ProgressNotifier> notifier_;
};

Error invalid_state(std::string message) {
    return make_error(ErrorCode::InvalidState, std::move(message));
}

} // namespace

SessionCoordinator::SessionCoordinator(UploadApi& api, SessionStore& store, events::EventBus& bus)
    : api_(api), store_(store), bus_(bus) {}

void SessionCoordinator::set_channel_connector(notify::ChannelConnector connector) {
    connector_ = std::move(connector);
}

std::unique_ptr<notify::ProgressNotifier> SessionCoordinator::open_notifier(const std::string& session_id) {
    if (!connector_) {
        return nullptr;
    }

    std::unique_ptr<notify::ProgressNotifier> notifier;
    auto channel = connector_(session_id);
    if (channel.is_ok()) {
        notifier = std::make_unique<notify::ProgressNotifier>(session_id, std::move(channel.value()),
                                                              bus_, notifier_options_);
        notifier->set_fallback([this, session_id](std::uint64_t last_sequence) {
            return std::make_unique<StatusPollingChannel>(api_, session_id, last_sequence);
        });
    } else {
        spdlog::warn("Push channel unavailable for {}: {}; polling status instead",
                     session_id, channel.error().message);
        notifier = std::make_unique<notify::ProgressNotifier>(
            session_id, std::make_unique<StatusPollingChannel>(api_, session_id), bus_, notifier_options_);
    }
    notifier->start();
    return notifier;
}

// ════════════════════════════════════════════════════════
// Initialization
// ════════════════════════════════════════════════════════

Result<std::shared_ptr<UploadSession>> SessionCoordinator::initialize(
    const FileDescriptor& file,
    std::shared_ptr<const ByteSource> bytes,
    const UploadOptions& options,
    std::optional<std::filesystem::path> source_path) {
    using SessionPtr = std::shared_ptr<UploadSession>;

    if (!bytes) {
        return Fail<SessionPtr>(ErrorCode::InvalidState, "initialize needs a byte source");
    }
    if (bytes->size() != file.total_size_bytes) {
        return Fail<SessionPtr>(ErrorCode::InvalidState,
                                "Byte source holds " + std::to_string(bytes->size())
                                + " bytes but descriptor says " + std::to_string(file.total_size_bytes));
    }

    InitializeRequest request;
    request.file = file;
    request.chunk_size = options.chunk_size_hint;
    request.options = options.metadata;

    auto response = api_.initialize(request);
    if (response.is_error()) {
        return Fail<SessionPtr>(ErrorCode::InitializationFailed, describe(response.error()));
    }
    const auto& init = response.value();

    if (init.session_id.empty() || init.chunk_size == 0) {
        return Fail<SessionPtr>(ErrorCode::InitializationFailed, "Server returned an incomplete session");
    }
    if (chunk_count_for(file.total_size_bytes, init.chunk_size) != init.total_chunks) {
        return Fail<SessionPtr>(ErrorCode::InitializationFailed,
                                "Server chunk layout (" + std::to_string(init.total_chunks) + " x "
                                + std::to_string(init.chunk_size) + ") does not cover "
                                + std::to_string(file.total_size_bytes) + " bytes");
    }

    auto chunks = ChunkSource::create(std::move(bytes), init.chunk_size);
    if (chunks.is_error()) {
        return Fail<SessionPtr>(ErrorCode::InitializationFailed, chunks.error().message);
    }

    auto session = std::make_shared<UploadSession>(init.session_id, file, init.chunk_size, init.total_chunks);

    SessionEntry entry;
    entry.session = session;
    entry.source = std::make_shared<const ChunkSource>(std::move(chunks.value()));
    entry.options = options;
    entry.source_path = std::move(source_path);

    auto stored = store_.create(entry);
    if (stored.is_error()) {
        if (stored.error().code != ErrorCode::IoError) {
            return Err<SessionPtr>(stored.error());
        }
        spdlog::warn("Session {} is not journaled: {}", init.session_id, stored.error().message);
    }

    bus_.emit(events::SessionInitializedEvent{
        init.session_id, file.name, file.total_size_bytes, init.total_chunks, init.chunk_size});
    return Ok(std::move(session));
}

Result<std::shared_ptr<UploadSession>> SessionCoordinator::initialize_file(const std::filesystem::path& path,
                                                                           const UploadOptions& options) {
    using SessionPtr = std::shared_ptr<UploadSession>;

    auto bytes = FileByteSource::open(path);
    if (bytes.is_error()) {
        return Err<SessionPtr>(bytes.error());
    }
    auto hash = sha256_file(path);
    if (hash.is_error()) {
        return Err<SessionPtr>(hash.error());
    }

    FileDescriptor file;
    file.name = path.filename().string();
    file.total_size_bytes = bytes.value()->size();
    file.content_hash = hash.value();

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return initialize(file, bytes.value(), options, ec ? path : absolute);
}

// ════════════════════════════════════════════════════════
// Runs
// ════════════════════════════════════════════════════════

Result<FinalizeResult> SessionCoordinator::upload(const std::string& session_id,
                                                  const ProgressCallback& on_progress) {
    auto found = store_.get(session_id);
    if (found.is_error()) {
        return Err<FinalizeResult>(found.error());
    }
    const SessionEntry entry = found.value();

    const auto status = entry.session->status();
    if (status != UploadStatus::Initialized) {
        return Err<FinalizeResult>(invalid_state(
            "Session " + session_id + " is " + to_string(status)
            + (is_terminal(status) ? "" : "; use resume")));
    }
    if (!entry.source) {
        return Err<FinalizeResult>(invalid_state("Session " + session_id + " has no byte source"));
    }

    auto token = begin_run(session_id);
    if (token.is_error()) {
        return Err<FinalizeResult>(token.error());
    }
    RunScope scope([this, session_id]() { end_run(session_id); },
                   open_notifier(session_id));

    auto moved = transition(entry, UploadStatus::Uploading);
    if (moved.is_error()) {
        return Err<FinalizeResult>(moved.error());
    }
    return drive(entry, entry.session->missing_chunks(), on_progress, *token.value());
}

Result<FinalizeResult> SessionCoordinator::resume(const std::string& session_id,
                                                  const ProgressCallback& on_progress) {
    auto found = store_.get(session_id);
    if (found.is_error()) {
        return Err<FinalizeResult>(found.error());
    }
    const SessionEntry entry = found.value();

    const auto status = entry.session->status();
    if (is_terminal(status)) {
        return Err<FinalizeResult>(invalid_state("Session " + session_id + " is " + to_string(status)));
    }
    if (!entry.source && status != UploadStatus::Finalizing) {
        return Err<FinalizeResult>(invalid_state("Session " + session_id + " has no byte source"));
    }

    auto token = begin_run(session_id);
    if (token.is_error()) {
        return Err<FinalizeResult>(token.error());
    }
    const CancellationToken& cancel = *token.value();
    RunScope scope([this, session_id]() { end_run(session_id); },
                   open_notifier(session_id));

    if (status == UploadStatus::Finalizing) {
        return finish(entry, cancel);
    }

    auto moved = transition(entry, UploadStatus::Resuming);
    if (moved.is_error()) {
        return Err<FinalizeResult>(moved.error());
    }

    ResumeReconciler reconciler(api_);
    auto reconciled = reconciler.reconcile(*entry.session);
    if (reconciled.is_error()) {
        const auto& error = reconciled.error();
        switch (error.code) {
            case ErrorCode::SessionExpired:
            case ErrorCode::ProtocolError:
            case ErrorCode::AssemblyFailed:
                return fail(entry, error);
            default:
                // Server unreachable: stay Resuming so a later resume can retry
                entry.session->record_error(error);
                persist(entry);
                return Err<FinalizeResult>(error);
        }
    }
    persist(entry);

    const auto& residual = reconciled.value();
    bus_.emit(events::ResumeReconciledEvent{session_id, residual.total_chunk_count, residual.missing_indices.size()});

    if (cancel.is_cancelled()) {
        return stopped(entry, cancel);
    }
    if (residual.missing_indices.empty()) {
        return finish(entry, cancel);
    }

    moved = transition(entry, UploadStatus::Uploading);
    if (moved.is_error()) {
        return Err<FinalizeResult>(moved.error());
    }
    return drive(entry, residual.missing_indices, on_progress, cancel);
}

Result<void> SessionCoordinator::cancel(const std::string& session_id) {
    auto found = store_.get(session_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    const SessionEntry entry = found.value();

    const auto status = entry.session->status();
    if (status == UploadStatus::Cancelled) {
        return Ok();
    }
    if (is_terminal(status)) {
        return Err<void>(invalid_state("Session " + session_id + " is already " + to_string(status)));
    }

    {
        std::lock_guard lock(runs_mutex_);
        auto it = runs_.find(session_id);
        if (it != runs_.end()) {
            it->second->cancel();
        }
    }

    auto marked = entry.session->mark_cancelled();
    if (marked.is_error()) {
        // Lost a race with the run reaching a terminal state
        if (entry.session->status() == UploadStatus::Cancelled) {
            return Ok();
        }
        return marked;
    }
    bus_.emit(events::SessionStateChangedEvent{session_id, to_string(status), to_string(UploadStatus::Cancelled)});
    bus_.emit(events::SessionCancelledEvent{session_id});

    auto remote = api_.cancel(session_id);
    if (remote.is_error()) {
        spdlog::warn("Server-side cancel of {} failed: {}", session_id, describe(remote.error()));
    }

    store_.forget(session_id);
    return Ok();
}

Result<void> SessionCoordinator::interrupt(const std::string& session_id) {
    {
        std::lock_guard lock(runs_mutex_);
        auto it = runs_.find(session_id);
        if (it == runs_.end()) {
            return Err<void>(invalid_state("No active run for session " + session_id));
        }
        it->second->interrupt();
    }

    auto found = store_.get(session_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    if (found.value().session->status() == UploadStatus::Uploading) {
        auto moved = transition(found.value(), UploadStatus::Resuming);
        if (moved.is_error()) {
            spdlog::debug("Interrupt of {} left state unchanged: {}", session_id, moved.error().message);
        }
    }
    return Ok();
}

bool SessionCoordinator::evict(const std::string& session_id) {
    if (is_running(session_id)) {
        spdlog::warn("Refusing to evict {} while a run is active", session_id);
        return false;
    }
    return store_.evict(session_id);
}

Result<std::shared_ptr<UploadSession>> SessionCoordinator::find(const std::string& session_id) {
    auto found = store_.get(session_id);
    if (found.is_error()) {
        return Err<std::shared_ptr<UploadSession>>(found.error());
    }
    return Ok(found.value().session);
}

bool SessionCoordinator::is_running(const std::string& session_id) const {
    std::lock_guard lock(runs_mutex_);
    return runs_.count(session_id) > 0;
}

// ════════════════════════════════════════════════════════
// Internals
// ════════════════════════════════════════════════════════

Result<std::shared_ptr<CancellationToken>> SessionCoordinator::begin_run(const std::string& session_id) {
    std::lock_guard lock(runs_mutex_);
    if (runs_.count(session_id) > 0) {
        return Fail<std::shared_ptr<CancellationToken>>(
            ErrorCode::InvalidState, "Session " + session_id + " already has a run in progress");
    }
    auto token = std::make_shared<CancellationToken>();
    runs_.emplace(session_id, token);
    return Ok(std::move(token));
}

void SessionCoordinator::end_run(const std::string& session_id) {
    std::lock_guard lock(runs_mutex_);
    runs_.erase(session_id);
}

Result<void> SessionCoordinator::transition(const SessionEntry& entry, UploadStatus next) {
    const auto from = entry.session->status();
    auto moved = entry.session->transition_to(next);
    if (moved.is_ok() && from != next) {
        bus_.emit(events::SessionStateChangedEvent{entry.session->session_id(), to_string(from), to_string(next)});
        persist(entry);
    }
    return moved;
}

void SessionCoordinator::persist(const SessionEntry& entry) {
    auto written = store_.persist(entry.session->session_id());
    if (written.is_error()) {
        spdlog::warn("Failed to journal {}: {}", entry.session->session_id(), written.error().message);
    }
}

Result<FinalizeResult> SessionCoordinator::drive(const SessionEntry& entry,
                                                 std::vector<ChunkIndex> pending,
                                                 const ProgressCallback& on_progress,
                                                 const CancellationToken& token) {
    auto& session = *entry.session;
    ChunkScheduler scheduler(api_, *entry.source, entry.options, &bus_);
    const std::uint32_t passes = std::max<std::uint32_t>(1, entry.options.max_passes);

    for (std::uint32_t pass = 1;; ++pass) {
        auto report = scheduler.schedule(session, pending, on_progress, token);
        persist(entry);

        if (token.is_cancelled()) {
            return stopped(entry, token);
        }
        if (report.is_error()) {
            if (session.status() == UploadStatus::Cancelled) {
                return Err<FinalizeResult>(make_error(ErrorCode::Cancelled, "Upload cancelled"));
            }
            return fail(entry, report.error());
        }
        if (session.is_complete()) {
            break;
        }

        pending = session.missing_chunks();
        if (pass >= passes) {
            return fail(entry, make_error(ErrorCode::ChunkPermanentError,
                                          std::to_string(pending.size()) + " chunk(s) still missing after "
                                          + std::to_string(passes) + " pass(es)"));
        }
        spdlog::info("Retrying {} chunk(s) of {} (pass {}/{})",
                     pending.size(), session.session_id(), pass + 1, passes);
    }

    return finish(entry, token);
}

Result<FinalizeResult> SessionCoordinator::finish(const SessionEntry& entry, const CancellationToken& token) {
    auto& session = *entry.session;
    if (token.is_cancelled()) {
        return stopped(entry, token);
    }

    auto moved = transition(entry, UploadStatus::Finalizing);
    if (moved.is_error()) {
        if (session.status() == UploadStatus::Cancelled) {
            return Err<FinalizeResult>(make_error(ErrorCode::Cancelled, "Upload cancelled"));
        }
        return Err<FinalizeResult>(moved.error());
    }

    Finalizer finalizer(api_, entry.options.retry);
    auto result = finalizer.finalize(session, &token);

    if (result.is_error()) {
        const auto& error = result.error();
        if (error.code == ErrorCode::Cancelled || error.code == ErrorCode::Interrupted) {
            return stopped(entry, token);
        }
        if (is_transient(error)) {
            // Assembly is idempotent: stay Finalizing and let resume() ask again
            session.record_error(error);
            persist(entry);
            return result;
        }
        return fail(entry, error);
    }

    const auto& assembled = result.value();
    auto completed = session.mark_completed(assembled.artifact_id);
    if (completed.is_error()) {
        if (session.status() == UploadStatus::Cancelled) {
            return Err<FinalizeResult>(make_error(ErrorCode::Cancelled, "Upload cancelled"));
        }
        return Err<FinalizeResult>(completed.error());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - session.started_at());
    bus_.emit(events::SessionStateChangedEvent{session.session_id(), to_string(UploadStatus::Finalizing),
                                               to_string(UploadStatus::Completed)});
    bus_.emit(events::UploadCompletedEvent{session.session_id(), assembled.artifact_id,
                                           assembled.total_bytes.value_or(session.file().total_size_bytes),
                                           elapsed});
    persist(entry);
    return result;
}

Result<FinalizeResult> SessionCoordinator::fail(const SessionEntry& entry, const Error& error) {
    auto& session = *entry.session;
    const auto from = session.status();

    auto marked = session.mark_failed(error);
    if (marked.is_error()) {
        if (session.status() == UploadStatus::Cancelled) {
            return Err<FinalizeResult>(make_error(ErrorCode::Cancelled, "Upload cancelled"));
        }
        return Err<FinalizeResult>(error);
    }

    bus_.emit(events::SessionStateChangedEvent{session.session_id(), to_string(from), to_string(UploadStatus::Failed)});
    bus_.emit(events::UploadFailedEvent{session.session_id(), error.code, error.message});
    persist(entry);
    return Err<FinalizeResult>(error);
}

Result<FinalizeResult> SessionCoordinator::stopped(const SessionEntry& entry, const CancellationToken& token) {
    const auto error = stop_error(token);
    if (error.code != ErrorCode::Interrupted) {
        return Err<FinalizeResult>(error);
    }

    auto& session = *entry.session;
    if (session.status() == UploadStatus::Uploading) {
        auto moved = transition(entry, UploadStatus::Resuming);
        if (moved.is_error()) {
            spdlog::warn("Could not mark {} resumable: {}", session.session_id(), moved.error().message);
        }
    }
    bus_.emit(events::SessionInterruptedEvent{session.session_id(), session.uploaded_count(), session.total_chunks()});
    persist(entry);
    return Err<FinalizeResult>(error);
}

} // namespace chunkup::upload
