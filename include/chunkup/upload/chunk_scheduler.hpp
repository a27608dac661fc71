#pragma once

#include "chunkup/core/cancellation.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/upload/chunk_source.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_api.hpp"

#include <vector>

namespace chunkup::upload {

/**
 * @brief Runs a fixed pool of transmission workers over a set of chunks
 *
 * schedule() starts min(K, pending) threads that pull indices from a
 * shared queue, so no more than K chunks are ever in flight and each
 * worker handles one chunk at a time. It returns once every started
 * transmission has finished.
 *
 * Dispatch stops (queued chunks are dropped, in-flight ones drain) when:
 * - permanently failed chunks exceed failure_tolerance
 * - any worker reports SessionExpired
 * - the cancellation token fires
 *
 * on_progress runs on worker threads and must be thread-safe.
 */
class ChunkScheduler {
public:
    ChunkScheduler(UploadApi& api,
                   const ChunkSource& source,
                   UploadOptions options,
                   events::EventBus* bus = nullptr);

    Result<ScheduleReport> schedule(UploadSession& session,
                                    const std::vector<ChunkIndex>& pending,
                                    const ProgressCallback& on_progress,
                                    const CancellationToken& cancel);

private:
    UploadApi& api_;
    const ChunkSource& source_;
    UploadOptions options_;
    events::EventBus* bus_;
};

} // namespace chunkup::upload
