#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"
#include "chunkup/upload/upload_api.hpp"

namespace chunkup::upload {

/**
 * @brief Replaces local progress with the server's accepted chunk set
 *
 * The server is authoritative: the residual work set is its
 * missing_chunks list (uploaded_chunks when a reply omits it), and the
 * complement replaces the session's uploaded set wholesale.
 *
 * Fails with SessionExpired when the server no longer knows the session
 * or reports it expired/cancelled, and with ProtocolError when its chunk
 * count disagrees with the local layout.
 */
class ResumeReconciler {
public:
    explicit ResumeReconciler(UploadApi& api) : api_(api) {}

    Result<ReconcileResult> reconcile(UploadSession& session);

private:
    UploadApi& api_;
};

} // namespace chunkup::upload
