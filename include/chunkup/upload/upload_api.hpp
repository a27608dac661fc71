#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Client view of the upload server contract
 *
 * Transport implementations translate their failures into the shared
 * ErrorCode taxonomy:
 * - Transient      network failure, timeout, 5xx
 * - Rejected       any other 4xx
 * - SessionExpired unknown (404) or expired (410) session
 * - ProtocolError  reply that cannot be decoded
 *
 * All calls are blocking and must be safe to issue concurrently from
 * several scheduler workers.
 */
class UploadApi {
public:
    virtual ~UploadApi() = default;

    virtual Result<InitializeResponse> initialize(const InitializeRequest& request) = 0;

    virtual Result<PutChunkResponse> put_chunk(const std::string& session_id,
                                               ChunkIndex index,
                                               const std::vector<std::uint8_t>& payload,
                                               std::chrono::milliseconds timeout) = 0;

    virtual Result<RemoteStatus> status(const std::string& session_id) = 0;

    /// Idempotent: repeating it after success returns the same artifact
    virtual Result<FinalizeResult> finalize(const std::string& session_id) = 0;

    virtual Result<void> cancel(const std::string& session_id) = 0;
};

} // namespace chunkup::upload
