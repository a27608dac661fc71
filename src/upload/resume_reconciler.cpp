#include "chunkup/upload/resume_reconciler.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

Result<ReconcileResult> ResumeReconciler::reconcile(UploadSession& session) {
    auto remote = api_.status(session.session_id());
    if (remote.is_error()) {
        return Err<ReconcileResult>(remote.error());
    }
    const auto& status = remote.value();

    switch (status.state) {
        case RemoteSessionState::Expired:
        case RemoteSessionState::Cancelled:
            return Fail<ReconcileResult>(ErrorCode::SessionExpired,
                                         "Server reports session " + session.session_id()
                                         + " as " + to_string(status.state));
        case RemoteSessionState::Failed:
            return Fail<ReconcileResult>(ErrorCode::AssemblyFailed,
                                         "Server failed to assemble session " + session.session_id());
        default:
            break;
    }

    if (status.total_chunks != session.total_chunks()) {
        return Fail<ReconcileResult>(ErrorCode::ProtocolError,
                                     "Server expects " + std::to_string(status.total_chunks)
                                     + " chunks, local layout has " + std::to_string(session.total_chunks()));
    }

    auto server_accepted = accepted_chunks(status);
    if (server_accepted.is_error()) {
        return Err<ReconcileResult>(server_accepted.error());
    }

    auto replaced = session.replace_uploaded(server_accepted.value());
    if (replaced.is_error()) {
        return Err<ReconcileResult>(replaced.error());
    }

    ReconcileResult result;
    result.total_chunk_count = session.total_chunks();
    result.missing_indices = session.missing_chunks();

    spdlog::debug("Reconciled {}: server holds {}/{}, {} missing",
                  session.session_id(), server_accepted.value().size(),
                  result.total_chunk_count, result.missing_indices.size());
    return Ok(std::move(result));
}

} // namespace chunkup::upload
