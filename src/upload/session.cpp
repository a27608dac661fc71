#include "chunkup/upload/session.hpp"

#include <algorithm>
#include <unordered_map>

namespace chunkup::upload {
namespace {

bool is_progressive(UploadStatus current, UploadStatus target) {
    static const std::unordered_map<UploadStatus, std::vector<UploadStatus>> transitions {
        {UploadStatus::Initialized, {UploadStatus::Uploading, UploadStatus::Resuming}},
        {UploadStatus::Uploading, {UploadStatus::Finalizing, UploadStatus::Resuming}},
        {UploadStatus::Resuming, {UploadStatus::Uploading, UploadStatus::Finalizing}},
        {UploadStatus::Finalizing, {UploadStatus::Completed}},
    };

    if (target == UploadStatus::Failed || target == UploadStatus::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

Error invalid_state(std::string message) {
    return make_error(ErrorCode::InvalidState, std::move(message));
}

} // namespace

std::uint32_t chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

UploadSession::UploadSession(std::string session_id, FileDescriptor file,
                             std::uint64_t chunk_size, std::uint32_t total_chunks)
    : session_id_(std::move(session_id)),
      file_(std::move(file)),
      chunk_size_(chunk_size),
      total_chunks_(total_chunks),
      started_at_(std::chrono::system_clock::now()) {}

Result<std::shared_ptr<UploadSession>> UploadSession::restore(const Snapshot& snapshot) {
    using SessionPtr = std::shared_ptr<UploadSession>;

    if (snapshot.chunk_size == 0) {
        return Fail<SessionPtr>(ErrorCode::ProtocolError, "Snapshot has zero chunk size");
    }
    if (chunk_count_for(snapshot.file.total_size_bytes, snapshot.chunk_size) != snapshot.total_chunks) {
        return Fail<SessionPtr>(ErrorCode::ProtocolError, "Snapshot chunk layout is inconsistent");
    }

    auto session = std::make_shared<UploadSession>(
        snapshot.session_id, snapshot.file, snapshot.chunk_size, snapshot.total_chunks);

    for (auto index : snapshot.uploaded_chunks) {
        if (index >= snapshot.total_chunks) {
            return Fail<SessionPtr>(ErrorCode::ProtocolError,
                                    "Snapshot lists out-of-range chunk " + std::to_string(index));
        }
        session->uploaded_.insert(index);
    }
    session->status_ = snapshot.status;
    session->errors_ = snapshot.errors;
    session->started_at_ = snapshot.started_at;
    session->ended_at_ = snapshot.ended_at;
    session->artifact_id_ = snapshot.artifact_id;
    return Ok(std::move(session));
}

UploadStatus UploadSession::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

Result<void> UploadSession::transition_to(UploadStatus next) {
    std::lock_guard lock(mutex_);
    return transition_locked(next);
}

Result<void> UploadSession::transition_locked(UploadStatus next) {
    if (status_ == next) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(invalid_state(std::string("Illegal session transition ")
                                       + to_string(status_) + " -> " + to_string(next)));
    }

    if (next == UploadStatus::Finalizing && uploaded_.size() != total_chunks_) {
        return Err<void>(invalid_state("Cannot finalize with " + std::to_string(uploaded_.size())
                                       + " of " + std::to_string(total_chunks_) + " chunks"));
    }

    status_ = next;
    if (is_terminal(next)) {
        ended_at_ = std::chrono::system_clock::now();
    }
    return Ok();
}

Result<void> UploadSession::mark_failed(const Error& error) {
    std::lock_guard lock(mutex_);
    errors_.push_back(ErrorRecord{error.chunk_index, error.code, error.message,
                                  std::chrono::system_clock::now()});
    return transition_locked(UploadStatus::Failed);
}

Result<void> UploadSession::mark_completed(std::string artifact_id) {
    std::lock_guard lock(mutex_);
    auto result = transition_locked(UploadStatus::Completed);
    if (result.is_ok()) {
        artifact_id_ = std::move(artifact_id);
    }
    return result;
}

Result<void> UploadSession::mark_cancelled() {
    std::lock_guard lock(mutex_);
    auto result = transition_locked(UploadStatus::Cancelled);
    if (result.is_ok()) {
        uploaded_.clear();
    }
    return result;
}

Result<std::size_t> UploadSession::record_chunk(ChunkIndex index) {
    std::lock_guard lock(mutex_);
    if (index >= total_chunks_) {
        return Err<std::size_t>(invalid_state("Chunk index " + std::to_string(index)
                                              + " outside [0, " + std::to_string(total_chunks_) + ")"));
    }
    if (is_terminal(status_)) {
        return Err<std::size_t>(invalid_state(std::string("Session is ") + to_string(status_)));
    }
    uploaded_.insert(index);
    return Ok(uploaded_.size());
}

Result<void> UploadSession::replace_uploaded(const std::vector<ChunkIndex>& accepted) {
    std::lock_guard lock(mutex_);
    if (is_terminal(status_)) {
        return Err<void>(invalid_state(std::string("Session is ") + to_string(status_)));
    }

    std::set<ChunkIndex> replacement;
    for (auto index : accepted) {
        if (index >= total_chunks_) {
            return Err<void>(make_error(ErrorCode::ProtocolError,
                                        "Server reported out-of-range chunk " + std::to_string(index)));
        }
        replacement.insert(index);
    }
    uploaded_ = std::move(replacement);
    return Ok();
}

void UploadSession::record_error(const Error& error) {
    std::lock_guard lock(mutex_);
    errors_.push_back(ErrorRecord{error.chunk_index, error.code, error.message,
                                  std::chrono::system_clock::now()});
}

bool UploadSession::has_chunk(ChunkIndex index) const {
    std::lock_guard lock(mutex_);
    return uploaded_.count(index) > 0;
}

bool UploadSession::is_complete() const {
    std::lock_guard lock(mutex_);
    return uploaded_.size() == total_chunks_;
}

std::size_t UploadSession::uploaded_count() const {
    std::lock_guard lock(mutex_);
    return uploaded_.size();
}

std::vector<ChunkIndex> UploadSession::uploaded_chunks() const {
    std::lock_guard lock(mutex_);
    return {uploaded_.begin(), uploaded_.end()};
}

std::vector<ChunkIndex> UploadSession::missing_chunks() const {
    std::lock_guard lock(mutex_);
    std::vector<ChunkIndex> missing;
    missing.reserve(total_chunks_ - uploaded_.size());
    for (ChunkIndex index = 0; index < total_chunks_; ++index) {
        if (uploaded_.count(index) == 0) {
            missing.push_back(index);
        }
    }
    return missing;
}

std::vector<ErrorRecord> UploadSession::errors() const {
    std::lock_guard lock(mutex_);
    return errors_;
}

std::optional<std::string> UploadSession::artifact_id() const {
    std::lock_guard lock(mutex_);
    return artifact_id_;
}

std::chrono::system_clock::time_point UploadSession::started_at() const {
    std::lock_guard lock(mutex_);
    return started_at_;
}

std::optional<std::chrono::system_clock::time_point> UploadSession::ended_at() const {
    std::lock_guard lock(mutex_);
    return ended_at_;
}

UploadSession::Snapshot UploadSession::snapshot() const {
    std::lock_guard lock(mutex_);
    Snapshot snap;
    snap.session_id = session_id_;
    snap.file = file_;
    snap.chunk_size = chunk_size_;
    snap.total_chunks = total_chunks_;
    snap.status = status_;
    snap.uploaded_chunks.assign(uploaded_.begin(), uploaded_.end());
    snap.errors = errors_;
    snap.started_at = started_at_;
    snap.ended_at = ended_at_;
    snap.artifact_id = artifact_id_;
    return snap;
}

bool UploadSession::can_transition(UploadStatus target) const noexcept {
    if (status_ == target) {
        return true;
    }

    if (is_terminal(status_)) {
        return false;
    }

    return is_progressive(status_, target);
}

} // namespace chunkup::upload
