#include "chunkup/upload/finalizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace chunkup::upload {

Result<FinalizeResult> Finalizer::finalize(const UploadSession& session, const CancellationToken* cancel) {
    if (!session.is_complete()) {
        return Fail<FinalizeResult>(ErrorCode::InvalidState,
                                    "Cannot finalize " + session.session_id() + ": "
                                    + std::to_string(session.uploaded_count()) + " of "
                                    + std::to_string(session.total_chunks()) + " chunks acknowledged");
    }

    const std::uint32_t max_attempts = std::max<std::uint32_t>(1, retry_.max_attempts);
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto result = api_.finalize(session.session_id());

        if (result.is_ok()) {
            const auto& assembled = result.value();
            const auto& file = session.file();
            if (assembled.artifact_id.empty()) {
                return Fail<FinalizeResult>(ErrorCode::ProtocolError, "Finalize reply has no artifact id");
            }
            if (assembled.total_bytes && *assembled.total_bytes != file.total_size_bytes) {
                return Fail<FinalizeResult>(ErrorCode::ProtocolError,
                                            "Server assembled " + std::to_string(*assembled.total_bytes)
                                            + " bytes, expected " + std::to_string(file.total_size_bytes));
            }
            if (file.content_hash && !assembled.content_hash.empty()
                && *file.content_hash != assembled.content_hash) {
                return Fail<FinalizeResult>(ErrorCode::AssemblyFailed,
                                            "Artifact hash " + assembled.content_hash
                                            + " does not match " + *file.content_hash);
            }
            return result;
        }

        if (!is_transient(result.error()) || attempt >= max_attempts) {
            return result;
        }

        const auto delay = retry_.delay_for(attempt);
        spdlog::warn("Finalize of {} failed ({}), retrying in {}ms",
                     session.session_id(), result.error().message, delay.count());
        if (cancel) {
            if (!cancel->wait_for(delay)) {
                return Err<FinalizeResult>(stop_error(*cancel));
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace chunkup::upload
