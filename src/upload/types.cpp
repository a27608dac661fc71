#include "chunkup/upload/types.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace chunkup::upload {

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    const double scaled = static_cast<double>(initial_backoff.count())
        * std::pow(multiplier, static_cast<double>(attempt - 1));
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

const char* to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::Initialized: return "initialized";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Resuming: return "resuming";
        case UploadStatus::Finalizing: return "finalizing";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<UploadStatus> upload_status_from_string(const std::string& name) {
    for (auto status : {UploadStatus::Initialized, UploadStatus::Uploading, UploadStatus::Resuming,
                        UploadStatus::Finalizing, UploadStatus::Completed, UploadStatus::Failed,
                        UploadStatus::Cancelled}) {
        if (name == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* to_string(RemoteSessionState state) {
    switch (state) {
        case RemoteSessionState::Active: return "active";
        case RemoteSessionState::Assembling: return "assembling";
        case RemoteSessionState::Completed: return "completed";
        case RemoteSessionState::Failed: return "failed";
        case RemoteSessionState::Cancelled: return "cancelled";
        case RemoteSessionState::Expired: return "expired";
    }
    return "unknown";
}

std::optional<RemoteSessionState> remote_state_from_string(const std::string& name) {
    for (auto state : {RemoteSessionState::Active, RemoteSessionState::Assembling,
                       RemoteSessionState::Completed, RemoteSessionState::Failed,
                       RemoteSessionState::Cancelled, RemoteSessionState::Expired}) {
        if (name == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

Result<std::vector<ChunkIndex>> accepted_chunks(const RemoteStatus& status) {
    auto out_of_range = [&](ChunkIndex index) {
        return Fail<std::vector<ChunkIndex>>(ErrorCode::ProtocolError,
                                             "Server reported chunk " + std::to_string(index) + " of "
                                             + std::to_string(status.total_chunks));
    };

    std::set<ChunkIndex> uploaded;
    if (status.uploaded_chunks) {
        for (auto index : *status.uploaded_chunks) {
            if (index >= status.total_chunks) {
                return out_of_range(index);
            }
            uploaded.insert(index);
        }
    }

    if (!status.missing_chunks) {
        if (!status.uploaded_chunks) {
            return Fail<std::vector<ChunkIndex>>(ErrorCode::ProtocolError,
                                                 "Status reply lists neither missing nor uploaded chunks");
        }
        return Ok(std::vector<ChunkIndex>(uploaded.begin(), uploaded.end()));
    }

    std::set<ChunkIndex> missing;
    for (auto index : *status.missing_chunks) {
        if (index >= status.total_chunks) {
            return out_of_range(index);
        }
        missing.insert(index);
    }

    std::vector<ChunkIndex> accepted;
    for (ChunkIndex index = 0; index < status.total_chunks; ++index) {
        if (missing.count(index) == 0) {
            accepted.push_back(index);
        }
    }
    if (status.uploaded_chunks && !std::equal(accepted.begin(), accepted.end(), uploaded.begin(), uploaded.end())) {
        return Fail<std::vector<ChunkIndex>>(ErrorCode::ProtocolError,
                                             "Status reply's uploaded and missing chunk lists disagree");
    }
    return Ok(std::move(accepted));
}

} // namespace chunkup::upload
