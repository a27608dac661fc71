#pragma once

#include "chunkup/core/cancellation.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/upload/chunk_source.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <chrono>
#include <string>

namespace chunkup::upload {

/**
 * @brief Uploads one chunk, retrying transient failures
 *
 * send() reads the payload, issues put_chunk with the per-attempt timeout
 * and retries Transient failures with the policy's exponential backoff.
 * Outcomes:
 * - ChunkAck on success (Accepted or AlreadyAccepted)
 * - SessionExpired unchanged
 * - Cancelled / Interrupted when the token fires before or between attempts
 * - ChunkPermanentError for everything else, including an exhausted
 *   attempt budget
 *
 * The payload lives only for the duration of send().
 */
class TransmissionWorker {
public:
    TransmissionWorker(UploadApi& api,
                       const ChunkSource& source,
                       RetryPolicy retry,
                       std::chrono::milliseconds attempt_timeout,
                       events::EventBus* bus = nullptr);

    Result<ChunkAck> send(const std::string& session_id,
                          const ChunkRange& chunk,
                          const CancellationToken* cancel = nullptr) const;

private:
    UploadApi& api_;
    const ChunkSource& source_;
    RetryPolicy retry_;
    std::chrono::milliseconds attempt_timeout_;
    events::EventBus* bus_;
};

} // namespace chunkup::upload
