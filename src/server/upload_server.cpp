#include "chunkup/server/upload_server.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chunkup::server {
namespace fs = std::filesystem;

using upload::RemoteSessionState;

namespace {

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool is_closed(RemoteSessionState state) {
    return state == RemoteSessionState::Cancelled || state == RemoteSessionState::Expired;
}

std::string artifact_file_name(const std::string& name) {
    auto file_name = fs::path(name).filename();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return "upload.bin";
    }
    return file_name.string();
}

} // namespace

UploadServer::UploadServer(ServerOptions options, events::EventBus& bus, ClockFn clock)
    : options_(std::move(options)),
      event_bus_(bus),
      clock_(std::move(clock)),
      staging_(options_.staging_root) {

    std::error_code ec;
    fs::create_directories(options_.artifact_root, ec);
    if (ec) {
        spdlog::warn("Could not create artifact root {}: {}", options_.artifact_root.string(), ec.message());
    }
}

std::chrono::system_clock::time_point UploadServer::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

// ════════════════════════════════════════════════════════
// Session lifecycle
// ════════════════════════════════════════════════════════

ServerResult<upload::InitializeResponse> UploadServer::initialize(const upload::InitializeRequest& request) {
    using Response = upload::InitializeResponse;

    if (request.file.name.empty()) {
        return server_fail<Response>(ServerErrorCode::BadRequest, "filename is required");
    }
    if (request.file.total_size_bytes == 0) {
        return server_fail<Response>(ServerErrorCode::BadRequest, "file_size must be positive");
    }
    if (request.file.total_size_bytes > options_.max_file_size) {
        return server_fail<Response>(ServerErrorCode::TooLarge,
                                     "file_size exceeds limit of " + std::to_string(options_.max_file_size));
    }

    std::uint64_t chunk_size = options_.chunk_size;
    if (request.chunk_size && options_.accept_chunk_size_hint) {
        if (*request.chunk_size < options_.min_chunk_size || *request.chunk_size > options_.max_chunk_size) {
            return server_fail<Response>(ServerErrorCode::BadRequest,
                                         "chunk_size must be within [" + std::to_string(options_.min_chunk_size)
                                         + ", " + std::to_string(options_.max_chunk_size) + "]");
        }
        chunk_size = *request.chunk_size;
    }

    auto record = std::make_shared<SessionRecord>();
    record->id = "session-" + std::to_string(++session_counter_);
    record->file = request.file;
    record->chunk_size = chunk_size;
    record->total_chunks = static_cast<std::uint32_t>((request.file.total_size_bytes + chunk_size - 1) / chunk_size);
    record->client_options = request.options;
    record->created_at = now();
    record->expires_at = record->created_at + options_.session_ttl;

    Response response{record->id, record->total_chunks, chunk_size, format_iso8601(record->expires_at)};
    {
        std::lock_guard lock(mutex_);
        sessions_.emplace(record->id, record);
    }

    event_bus_.emit(events::UploadSessionOpenedEvent{
        record->id, record->file.name, record->file.total_size_bytes, record->total_chunks});
    return server_ok(std::move(response));
}

ServerResult<upload::PutChunkResponse> UploadServer::accept_chunk(const std::string& session_id,
                                                                  std::uint32_t index,
                                                                  const std::vector<std::uint8_t>& data) {
    using Response = upload::PutChunkResponse;

    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<Response>(found.error());
    }
    auto& record = *found.value();

    std::shared_lock gate(record.gate);
    {
        std::lock_guard lock(record.mutex);
        expire_if_due(record, now());

        if (is_closed(record.state)) {
            return server_fail<Response>(ServerErrorCode::Gone,
                                         "Session " + session_id + " is " + upload::to_string(record.state));
        }
        if (index >= record.total_chunks) {
            return server_fail<Response>(ServerErrorCode::BadRequest,
                                         "Chunk " + std::to_string(index) + " outside [0, "
                                         + std::to_string(record.total_chunks) + ")");
        }
        if (record.accepted.count(index) > 0) {
            duplicate_chunks_++;
            event_bus_.emit(events::ChunkReceivedEvent{session_id, index, data.size(), true});
            return server_ok(Response{index, upload::ChunkAckStatus::AlreadyAccepted,
                                      record.accepted.size(), record.total_chunks});
        }
        if (record.state != RemoteSessionState::Active) {
            return server_fail<Response>(ServerErrorCode::Conflict,
                                         "Session " + session_id + " is " + upload::to_string(record.state));
        }

        const std::uint64_t offset = static_cast<std::uint64_t>(index) * record.chunk_size;
        const std::uint64_t expected = std::min(record.chunk_size, record.file.total_size_bytes - offset);
        if (data.size() != expected) {
            return server_fail<Response>(ServerErrorCode::BadRequest,
                                         "Chunk " + std::to_string(index) + " must be " + std::to_string(expected)
                                         + " bytes, got " + std::to_string(data.size()));
        }
    }

    auto written = staging_.write_chunk(session_id, index, data);
    if (written.is_error()) {
        spdlog::error("Staging chunk {} of {} failed: {}", index, session_id, written.error().message);
        return Err<Response>(written.error());
    }

    std::lock_guard lock(record.mutex);
    if (record.state != RemoteSessionState::Active) {
        return server_fail<Response>(ServerErrorCode::Gone,
                                     "Session " + session_id + " closed during upload");
    }

    const bool inserted = record.accepted.insert(index).second;
    if (inserted) {
        chunks_accepted_++;
        bytes_received_ += data.size();
        notify::ProgressEvent event;
        event.type = notify::ProgressEventType::ChunkAcked;
        event.chunk_index = index;
        record_event(record, std::move(event));
    } else {
        duplicate_chunks_++;
    }

    event_bus_.emit(events::ChunkReceivedEvent{session_id, index, data.size(), !inserted});
    return server_ok(Response{index,
                              inserted ? upload::ChunkAckStatus::Accepted : upload::ChunkAckStatus::AlreadyAccepted,
                              record.accepted.size(), record.total_chunks});
}

ServerResult<upload::RemoteStatus> UploadServer::status(const std::string& session_id) {
    using Status = upload::RemoteStatus;

    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<Status>(found.error());
    }
    auto& record = *found.value();

    std::lock_guard lock(record.mutex);
    expire_if_due(record, now());
    if (record.state == RemoteSessionState::Expired) {
        return server_fail<Status>(ServerErrorCode::Gone, "Session " + session_id + " expired");
    }

    Status status;
    status.session_id = record.id;
    status.state = record.state;
    status.total_chunks = record.total_chunks;
    status.uploaded_chunks.emplace(record.accepted.begin(), record.accepted.end());
    auto& missing = status.missing_chunks.emplace();
    for (std::uint32_t index = 0; index < record.total_chunks; ++index) {
        if (record.accepted.count(index) == 0) {
            missing.push_back(index);
        }
    }
    if (record.result) {
        status.artifact_id = record.result->artifact_id;
    }
    return server_ok(std::move(status));
}

ServerResult<upload::FinalizeResult> UploadServer::finalize(const std::string& session_id) {
    using Finalized = upload::FinalizeResult;

    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<Finalized>(found.error());
    }
    auto& record = *found.value();

    std::unique_lock gate(record.gate);
    {
        std::lock_guard lock(record.mutex);
        expire_if_due(record, now());

        if (record.state == RemoteSessionState::Completed && record.result) {
            return server_ok(*record.result);
        }
        if (is_closed(record.state)) {
            return server_fail<Finalized>(ServerErrorCode::Gone,
                                          "Session " + session_id + " is " + upload::to_string(record.state));
        }
        if (record.state == RemoteSessionState::Failed) {
            return server_fail<Finalized>(ServerErrorCode::AssemblyFailed,
                                          "Assembly of " + session_id + " already failed");
        }
        if (record.accepted.size() != record.total_chunks) {
            ServerError error{ServerErrorCode::Conflict,
                              "Session " + session_id + " is incomplete: "
                              + std::to_string(record.accepted.size()) + " of "
                              + std::to_string(record.total_chunks) + " chunks",
                              {}};
            for (std::uint32_t index = 0; index < record.total_chunks; ++index) {
                if (record.accepted.count(index) == 0) {
                    error.missing_chunks.push_back(index);
                }
            }
            return Err<Finalized>(std::move(error));
        }

        record.state = RemoteSessionState::Assembling;
        notify::ProgressEvent started;
        started.type = notify::ProgressEventType::AssemblyStarted;
        record_event(record, std::move(started));
    }

    const std::string artifact_id = "artifact-" + std::to_string(++artifact_counter_);
    const fs::path artifact_dir = options_.artifact_root / artifact_id;
    const fs::path final_path = artifact_dir / artifact_file_name(record.file.name);
    fs::path assembling_path = final_path;
    assembling_path += ".assembling";

    auto assembled = staging_.assemble(session_id, record.total_chunks, assembling_path);

    std::optional<ServerError> failure;
    if (assembled.is_error()) {
        failure = assembled.error();
    } else if (assembled.value().total_bytes != record.file.total_size_bytes) {
        failure = ServerError{ServerErrorCode::AssemblyFailed,
                              "Assembled " + std::to_string(assembled.value().total_bytes) + " bytes, expected "
                              + std::to_string(record.file.total_size_bytes), {}};
    } else if (record.file.content_hash && *record.file.content_hash != assembled.value().content_hash) {
        failure = ServerError{ServerErrorCode::AssemblyFailed,
                              "Content hash mismatch: expected " + *record.file.content_hash
                              + ", assembled " + assembled.value().content_hash, {}};
    } else {
        std::error_code ec;
        fs::rename(assembling_path, final_path, ec);
        if (ec) {
            failure = ServerError{ServerErrorCode::Internal, "Failed to publish artifact: " + ec.message(), {}};
        }
    }

    if (failure) {
        std::error_code ignored;
        fs::remove_all(artifact_dir, ignored);

        std::lock_guard lock(record.mutex);
        if (failure->code == ServerErrorCode::AssemblyFailed) {
            record.state = RemoteSessionState::Failed;
            notify::ProgressEvent failed;
            failed.type = notify::ProgressEventType::AssemblyFailed;
            failed.reason = failure->message;
            record_event(record, std::move(failed));
        } else {
            // Storage trouble: staged chunks are intact, a later finalize may succeed
            record.state = RemoteSessionState::Active;
        }
        spdlog::error("Finalize of {} failed: {}", session_id, failure->message);
        return Err<Finalized>(std::move(*failure));
    }

    Finalized result{artifact_id, assembled.value().content_hash, assembled.value().total_bytes};
    staging_.remove_session(session_id);
    {
        std::lock_guard lock(mutex_);
        artifacts_[artifact_id] = final_path;
    }
    {
        std::lock_guard lock(record.mutex);
        record.state = RemoteSessionState::Completed;
        record.result = result;
        notify::ProgressEvent completed;
        completed.type = notify::ProgressEventType::AssemblyCompleted;
        completed.artifact_id = artifact_id;
        record_event(record, std::move(completed));
    }

    artifacts_assembled_++;
    event_bus_.emit(events::ArtifactAssembledEvent{session_id, artifact_id, assembled.value().total_bytes,
                                                   result.content_hash});
    return server_ok(std::move(result));
}

ServerResult<void> UploadServer::cancel(const std::string& session_id) {
    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto& record = *found.value();

    {
        std::unique_lock gate(record.gate);
        std::lock_guard lock(record.mutex);
        expire_if_due(record, now());

        switch (record.state) {
            case RemoteSessionState::Cancelled:
                return server_ok();
            case RemoteSessionState::Expired:
                return server_fail<void>(ServerErrorCode::Gone, "Session " + session_id + " expired");
            case RemoteSessionState::Completed:
                return server_fail<void>(ServerErrorCode::Conflict, "Session " + session_id + " already completed");
            default:
                break;
        }
        record.state = RemoteSessionState::Cancelled;
        record.events_cv.notify_all();
    }

    staging_.remove_session(session_id);
    event_bus_.emit(events::UploadSessionClosedEvent{session_id, "cancelled"});
    return server_ok();
}

// ════════════════════════════════════════════════════════
// Push events
// ════════════════════════════════════════════════════════

ServerResult<std::vector<notify::ProgressEvent>> UploadServer::events_after(const std::string& session_id,
                                                                           std::uint64_t after,
                                                                           std::chrono::milliseconds wait) {
    using Events = std::vector<notify::ProgressEvent>;

    auto found = find_session(session_id);
    if (found.is_error()) {
        return Err<Events>(found.error());
    }
    auto& record = *found.value();

    std::unique_lock lock(record.mutex);
    record.events_cv.wait_for(lock, wait, [&]() {
        return record.events.size() > after
            || is_closed(record.state)
            || record.state == RemoteSessionState::Completed
            || record.state == RemoteSessionState::Failed;
    });

    Events batch;
    // Sequence n lives at events[n - 1]
    for (std::size_t i = static_cast<std::size_t>(after);
         i < record.events.size() && batch.size() < options_.max_events_per_poll; ++i) {
        batch.push_back(record.events[i]);
    }
    return server_ok(std::move(batch));
}

void UploadServer::record_event(SessionRecord& record, notify::ProgressEvent event) {
    event.sequence = record.events.size() + 1;
    event.session_id = record.id;
    record.events.push_back(std::move(event));
    record.events_cv.notify_all();
}

// ════════════════════════════════════════════════════════
// Housekeeping
// ════════════════════════════════════════════════════════

std::size_t UploadServer::sweep() {
    std::vector<RecordPtr> records;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, record] : sessions_) {
            records.push_back(record);
        }
    }

    const auto current = now();
    std::size_t swept = 0;
    std::vector<std::string> drop;

    for (const auto& record : records) {
        bool expired_now = false;
        bool closed = false;
        bool stale = false;
        {
            std::unique_lock gate(record->gate);
            std::lock_guard lock(record->mutex);
            expired_now = expire_if_due(*record, current);
            closed = is_closed(record->state);
            stale = closed && current >= record->expires_at + options_.session_ttl;
        }

        if (expired_now) {
            ++swept;
            event_bus_.emit(events::UploadSessionClosedEvent{record->id, "expired"});
        }
        if (closed && staging_.has_session(record->id)) {
            staging_.remove_session(record->id);
        }
        if (stale) {
            drop.push_back(record->id);
        }
    }

    if (!drop.empty()) {
        std::lock_guard lock(mutex_);
        for (const auto& id : drop) {
            sessions_.erase(id);
            ++swept;
        }
    }

    if (swept > 0) {
        spdlog::info("Sweep expired or removed {} session(s)", swept);
    }
    return swept;
}

bool UploadServer::expire_if_due(SessionRecord& record, std::chrono::system_clock::time_point current) {
    if (record.state != RemoteSessionState::Active || current < record.expires_at) {
        return false;
    }
    record.state = RemoteSessionState::Expired;
    record.events_cv.notify_all();
    return true;
}

ServerMetrics UploadServer::metrics() const {
    std::vector<RecordPtr> records;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, record] : sessions_) {
            records.push_back(record);
        }
    }

    ServerMetrics metrics;
    for (const auto& record : records) {
        std::lock_guard lock(record->mutex);
        metrics.sessions_by_state[upload::to_string(record->state)]++;
    }
    metrics.chunks_accepted = chunks_accepted_.load();
    metrics.duplicate_chunks = duplicate_chunks_.load();
    metrics.bytes_received = bytes_received_.load();
    metrics.artifacts_assembled = artifacts_assembled_.load();
    return metrics;
}

std::optional<fs::path> UploadServer::artifact_path(const std::string& artifact_id) const {
    std::lock_guard lock(mutex_);
    auto it = artifacts_.find(artifact_id);
    if (it == artifacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ServerResult<UploadServer::RecordPtr> UploadServer::find_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return server_fail<RecordPtr>(ServerErrorCode::NotFound, "Unknown session: " + session_id);
    }
    return server_ok(it->second);
}

} // namespace chunkup::server
