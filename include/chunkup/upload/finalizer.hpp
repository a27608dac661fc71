#pragma once

#include "chunkup/core/cancellation.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_api.hpp"

namespace chunkup::upload {

/**
 * @brief Requests server-side assembly once every chunk is acknowledged
 *
 * Refuses with InvalidState while coverage is incomplete. Transient
 * failures are retried with the session's retry policy; server assembly
 * is idempotent so a repeated call yields the same artifact.
 *
 * The reply is cross-checked against the descriptor: a size mismatch is
 * a ProtocolError, a content-hash mismatch an AssemblyFailed.
 */
class Finalizer {
public:
    Finalizer(UploadApi& api, RetryPolicy retry) : api_(api), retry_(retry) {}

    Result<FinalizeResult> finalize(const UploadSession& session,
                                    const CancellationToken* cancel = nullptr);

private:
    UploadApi& api_;
    RetryPolicy retry_;
};

} // namespace chunkup::upload
