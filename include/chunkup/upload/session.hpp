#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Client-side view of one server upload session
 *
 * Holds the immutable chunk layout plus the mutable progress (accepted
 * chunk set, status, error log). All members are guarded by one mutex so
 * scheduler workers, the coordinator and cancel() callers may share a
 * session through a shared_ptr.
 *
 * The accepted set only ever holds indices in [0, total_chunks). It grows
 * through record_chunk(), is replaced by replace_uploaded() after
 * reconciliation and is cleared on cancellation. Once the session reaches
 * a terminal status record_chunk() refuses further indices.
 */
class UploadSession {
public:
    /// Serializable copy of the full session state
    struct Snapshot {
        std::string session_id;
        FileDescriptor file;
        std::uint64_t chunk_size = 0;
        std::uint32_t total_chunks = 0;
        UploadStatus status = UploadStatus::Initialized;
        std::vector<ChunkIndex> uploaded_chunks;
        std::vector<ErrorRecord> errors;
        std::chrono::system_clock::time_point started_at{};
        std::optional<std::chrono::system_clock::time_point> ended_at;
        std::optional<std::string> artifact_id;
    };

    UploadSession(std::string session_id, FileDescriptor file,
                  std::uint64_t chunk_size, std::uint32_t total_chunks);

    static Result<std::shared_ptr<UploadSession>> restore(const Snapshot& snapshot);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const FileDescriptor& file() const noexcept { return file_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint32_t total_chunks() const noexcept { return total_chunks_; }

    [[nodiscard]] UploadStatus status() const;

    Result<void> transition_to(UploadStatus next);

    /// Append @p error to the log and move to Failed
    Result<void> mark_failed(const Error& error);

    /// Move to Completed and remember the server's artifact id
    Result<void> mark_completed(std::string artifact_id);

    /// Move to Cancelled and drop all recorded progress
    Result<void> mark_cancelled();

    /**
     * @brief Record a chunk the server durably accepted
     * @return Number of accepted chunks after the insert
     */
    Result<std::size_t> record_chunk(ChunkIndex index);

    Result<void> replace_uploaded(const std::vector<ChunkIndex>& accepted);

    void record_error(const Error& error);

    [[nodiscard]] bool has_chunk(ChunkIndex index) const;
    [[nodiscard]] bool is_complete() const;
    [[nodiscard]] std::size_t uploaded_count() const;
    [[nodiscard]] std::vector<ChunkIndex> uploaded_chunks() const;
    [[nodiscard]] std::vector<ChunkIndex> missing_chunks() const;
    [[nodiscard]] std::vector<ErrorRecord> errors() const;
    [[nodiscard]] std::optional<std::string> artifact_id() const;
    [[nodiscard]] std::chrono::system_clock::time_point started_at() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> ended_at() const;

    [[nodiscard]] Snapshot snapshot() const;

private:
    Result<void> transition_locked(UploadStatus next);
    [[nodiscard]] bool can_transition(UploadStatus target) const noexcept;

    const std::string session_id_;
    const FileDescriptor file_;
    const std::uint64_t chunk_size_;
    const std::uint32_t total_chunks_;

    mutable std::mutex mutex_;
    UploadStatus status_ = UploadStatus::Initialized;
    std::set<ChunkIndex> uploaded_;
    std::vector<ErrorRecord> errors_;
    std::chrono::system_clock::time_point started_at_{};
    std::optional<std::chrono::system_clock::time_point> ended_at_;
    std::optional<std::string> artifact_id_;
};

/// ceil(total_size / chunk_size); 0 for an empty file
std::uint32_t chunk_count_for(std::uint64_t total_size, std::uint64_t chunk_size) noexcept;

} // namespace chunkup::upload
