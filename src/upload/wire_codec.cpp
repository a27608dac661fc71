#include "chunkup/upload/wire_codec.hpp"

#include <map>
#include <string>

namespace chunkup::upload {

using json = nlohmann::json;

namespace {

template<typename T, typename Fn>
Result<T> decode(const json& j, const char* what, Fn&& fn) {
    if (!j.is_object()) {
        return Fail<T>(ErrorCode::ProtocolError, std::string(what) + " must be a JSON object");
    }
    try {
        return fn();
    } catch (const json::exception& e) {
        return Fail<T>(ErrorCode::ProtocolError, std::string("Malformed ") + what + ": " + e.what());
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════

json initialize_request_to_json(const InitializeRequest& request) {
    json j;
    j["filename"] = request.file.name;
    j["file_size"] = request.file.total_size_bytes;
    if (request.file.content_hash) {
        j["file_hash"] = *request.file.content_hash;
    }
    if (request.chunk_size) {
        j["chunk_size"] = *request.chunk_size;
    }
    j["options"] = request.options;
    return j;
}

Result<InitializeRequest> initialize_request_from_json(const json& j) {
    return decode<InitializeRequest>(j, "initialize request", [&]() {
        InitializeRequest request;
        request.file.name = j.at("filename").get<std::string>();
        request.file.total_size_bytes = j.at("file_size").get<std::uint64_t>();
        if (j.contains("file_hash") && !j["file_hash"].is_null()) {
            request.file.content_hash = j["file_hash"].get<std::string>();
        }
        if (j.contains("chunk_size") && !j["chunk_size"].is_null()) {
            request.chunk_size = j["chunk_size"].get<std::uint64_t>();
        }
        if (j.contains("options")) {
            request.options = j["options"].get<std::map<std::string, std::string>>();
        }
        return Ok(std::move(request));
    });
}

json initialize_response_to_json(const InitializeResponse& response) {
    return {
        {"session_id", response.session_id},
        {"total_chunks", response.total_chunks},
        {"chunk_size", response.chunk_size},
        {"expires_at", response.expires_at}
    };
}

Result<InitializeResponse> initialize_response_from_json(const json& j) {
    return decode<InitializeResponse>(j, "initialize response", [&]() {
        InitializeResponse response;
        response.session_id = j.at("session_id").get<std::string>();
        response.total_chunks = j.at("total_chunks").get<std::uint32_t>();
        response.chunk_size = j.at("chunk_size").get<std::uint64_t>();
        response.expires_at = j.value("expires_at", "");
        return Ok(std::move(response));
    });
}

// ═══════════════════════════════════════════════════════════════
// Chunks
// ═══════════════════════════════════════════════════════════════

json put_chunk_response_to_json(const PutChunkResponse& response) {
    json j = {
        {"status", response.status == ChunkAckStatus::AlreadyAccepted ? "already_accepted" : "accepted"},
        {"uploaded_chunks", response.uploaded_count},
        {"total_chunks", response.total_chunks}
    };
    if (response.index) {
        j["chunk_number"] = *response.index;
    }
    return j;
}

Result<PutChunkResponse> put_chunk_response_from_json(const json& j) {
    return decode<PutChunkResponse>(j, "chunk response", [&]() -> Result<PutChunkResponse> {
        PutChunkResponse response;
        if (j.contains("chunk_number")) {
            response.index = j["chunk_number"].get<ChunkIndex>();
        }
        auto status = j.at("status").get<std::string>();
        // "uploaded" and "already_uploaded" are older server spellings
        if (status == "accepted" || status == "uploaded") {
            response.status = ChunkAckStatus::Accepted;
        } else if (status == "already_accepted" || status == "already_uploaded") {
            response.status = ChunkAckStatus::AlreadyAccepted;
        } else {
            return Fail<PutChunkResponse>(ErrorCode::ProtocolError, "Unknown chunk status: " + status);
        }
        response.uploaded_count = j.value("uploaded_chunks", static_cast<std::size_t>(0));
        response.total_chunks = j.value("total_chunks", static_cast<std::uint32_t>(0));
        return Ok(std::move(response));
    });
}

// ═══════════════════════════════════════════════════════════════
// Status and finalize
// ═══════════════════════════════════════════════════════════════

json remote_status_to_json(const RemoteStatus& status) {
    json j = {
        {"session_id", status.session_id},
        {"status", to_string(status.state)},
        {"total_chunks", status.total_chunks}
    };
    if (status.uploaded_chunks) {
        j["uploaded_chunks"] = *status.uploaded_chunks;
    }
    if (status.missing_chunks) {
        j["missing_chunks"] = *status.missing_chunks;
    }
    if (status.artifact_id) {
        j["artifact_id"] = *status.artifact_id;
    }
    return j;
}

Result<RemoteStatus> remote_status_from_json(const json& j) {
    return decode<RemoteStatus>(j, "status response", [&]() -> Result<RemoteStatus> {
        RemoteStatus status;
        status.session_id = j.value("session_id", "");
        auto state_name = j.at("status").get<std::string>();
        auto state = remote_state_from_string(state_name);
        if (!state) {
            return Fail<RemoteStatus>(ErrorCode::ProtocolError, "Unknown session state: " + state_name);
        }
        status.state = *state;
        status.total_chunks = j.at("total_chunks").get<std::uint32_t>();
        if (j.contains("uploaded_chunks")) {
            status.uploaded_chunks = j["uploaded_chunks"].get<std::vector<ChunkIndex>>();
        }
        if (j.contains("missing_chunks")) {
            status.missing_chunks = j["missing_chunks"].get<std::vector<ChunkIndex>>();
        }
        if (j.contains("artifact_id") && j["artifact_id"].is_string()) {
            status.artifact_id = j["artifact_id"].get<std::string>();
        }
        return Ok(std::move(status));
    });
}

json finalize_result_to_json(const FinalizeResult& result) {
    json j = {{"artifact_id", result.artifact_id}};
    if (!result.content_hash.empty()) {
        j["file_hash"] = result.content_hash;
    }
    if (result.total_bytes) {
        j["total_bytes"] = *result.total_bytes;
    }
    return j;
}

Result<FinalizeResult> finalize_result_from_json(const json& j) {
    return decode<FinalizeResult>(j, "finalize response", [&]() {
        FinalizeResult result;
        result.artifact_id = j.at("artifact_id").get<std::string>();
        result.content_hash = j.value("file_hash", "");
        if (j.contains("total_bytes")) {
            result.total_bytes = j["total_bytes"].get<std::uint64_t>();
        }
        return Ok(std::move(result));
    });
}

} // namespace chunkup::upload
