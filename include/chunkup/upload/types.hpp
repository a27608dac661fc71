#pragma once

#include "chunkup/core/error.hpp"
#include "chunkup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

using ChunkIndex = std::uint32_t;

/**
 * @brief Identity of the file being uploaded, captured once at initialization
 */
struct FileDescriptor {
    std::string name;
    std::uint64_t total_size_bytes = 0;
    std::optional<std::string> content_hash;  ///< SHA-256 hex of the whole file
};

/**
 * @brief Per-chunk retry schedule
 *
 * Attempt n (1-based) that fails transiently waits
 * initial_backoff * multiplier^(n-1), capped at max_backoff, before the
 * next attempt. No wait follows the last attempt.
 */
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    std::chrono::milliseconds max_backoff{5000};
    double multiplier = 2.0;

    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt) const;
};

struct SchedulerOptions {
    std::size_t worker_count = 4;
    std::size_t failure_tolerance = 0;  ///< Permanently failed chunks allowed before stopping
};

struct UploadOptions {
    SchedulerOptions scheduler;
    RetryPolicy retry;
    std::chrono::milliseconds attempt_timeout{30000};
    std::optional<std::uint64_t> chunk_size_hint;  ///< Server may ignore
    std::uint32_t max_passes = 2;                  ///< Scheduling passes per run when failures are tolerated
    std::map<std::string, std::string> metadata;   ///< Forwarded as initialize options
};

enum class UploadStatus {
    Initialized,
    Uploading,
    Resuming,
    Finalizing,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(UploadStatus status);
std::optional<UploadStatus> upload_status_from_string(const std::string& name);

[[nodiscard]] inline bool is_terminal(UploadStatus status) noexcept {
    return status == UploadStatus::Completed
        || status == UploadStatus::Failed
        || status == UploadStatus::Cancelled;
}

struct ErrorRecord {
    std::optional<ChunkIndex> chunk_index;
    ErrorCode code = ErrorCode::ProtocolError;
    std::string message;
    std::chrono::system_clock::time_point timestamp{};
};

/// Half-open [offset, offset + length)
struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }
};

struct ChunkRange {
    ChunkIndex index = 0;
    ByteRange bytes;
};

enum class ChunkAckStatus {
    Accepted,
    AlreadyAccepted
};

struct ChunkAck {
    ChunkIndex index = 0;
    ChunkAckStatus status = ChunkAckStatus::Accepted;
    std::uint32_t attempts = 1;
};

struct ProgressUpdate {
    ChunkIndex index = 0;
    std::size_t uploaded_count = 0;
    std::size_t total_count = 0;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

// ════════════════════════════════════════════════════════
// Server contract payloads
// ════════════════════════════════════════════════════════

struct InitializeRequest {
    FileDescriptor file;
    std::optional<std::uint64_t> chunk_size;
    std::map<std::string, std::string> options;
};

struct InitializeResponse {
    std::string session_id;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunk_size = 0;
    std::string expires_at;  ///< ISO-8601, informational
};

struct PutChunkResponse {
    std::optional<ChunkIndex> index;  ///< Echoed chunk number, when the server sends one
    ChunkAckStatus status = ChunkAckStatus::Accepted;
    std::size_t uploaded_count = 0;
    std::uint32_t total_chunks = 0;
};

enum class RemoteSessionState {
    Active,
    Assembling,
    Completed,
    Failed,
    Cancelled,
    Expired
};

const char* to_string(RemoteSessionState state);
std::optional<RemoteSessionState> remote_state_from_string(const std::string& name);

struct RemoteStatus {
    std::string session_id;
    RemoteSessionState state = RemoteSessionState::Active;
    std::uint32_t total_chunks = 0;
    std::optional<std::vector<ChunkIndex>> uploaded_chunks;
    std::optional<std::vector<ChunkIndex>> missing_chunks;  ///< Authoritative when present
    std::optional<std::string> artifact_id;
};

/**
 * @brief Chunks the server holds, in ascending order
 *
 * Derived as the complement of missing_chunks when the reply lists them;
 * uploaded_chunks is then only cross-checked. A reply with neither list, an
 * out-of-range index, or lists that disagree is a ProtocolError.
 */
Result<std::vector<ChunkIndex>> accepted_chunks(const RemoteStatus& status);

struct FinalizeResult {
    std::string artifact_id;
    std::string content_hash;                ///< Empty when the server does not report one
    std::optional<std::uint64_t> total_bytes;
};

// ════════════════════════════════════════════════════════
// Component results
// ════════════════════════════════════════════════════════

struct ReconcileResult {
    std::uint32_t total_chunk_count = 0;
    std::vector<ChunkIndex> missing_indices;
};

struct ScheduleReport {
    std::size_t acked = 0;
    std::size_t failed = 0;
    std::size_t peak_concurrency = 0;
    std::vector<ChunkIndex> failed_indices;
};

} // namespace chunkup::upload
