#include "chunkup/upload/json_codec.hpp"

namespace chunkup::upload {

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json file_descriptor_to_json(const FileDescriptor& file) {
    json j;
    j["name"] = file.name;
    j["size"] = file.total_size_bytes;
    if (file.content_hash) {
        j["hash"] = *file.content_hash;
    }
    return j;
}

FileDescriptor file_descriptor_from_json(const json& j) {
    FileDescriptor file;
    file.name = j.value("name", "");
    file.total_size_bytes = j.value("size", static_cast<std::uint64_t>(0));
    if (j.contains("hash") && j["hash"].is_string()) {
        file.content_hash = j["hash"].get<std::string>();
    }
    return file;
}

json options_to_json(const UploadOptions& options) {
    json j;
    j["workers"] = options.scheduler.worker_count;
    j["failure_tolerance"] = options.scheduler.failure_tolerance;
    j["max_attempts"] = options.retry.max_attempts;
    j["initial_backoff_ms"] = options.retry.initial_backoff.count();
    j["max_backoff_ms"] = options.retry.max_backoff.count();
    j["backoff_multiplier"] = options.retry.multiplier;
    j["attempt_timeout_ms"] = options.attempt_timeout.count();
    j["max_passes"] = options.max_passes;
    if (options.chunk_size_hint) {
        j["chunk_size"] = *options.chunk_size_hint;
    }
    j["metadata"] = options.metadata;
    return j;
}

Result<UploadOptions> options_from_json(const json& j, UploadOptions defaults) {
    if (!j.is_object()) {
        return Fail<UploadOptions>(ErrorCode::ProtocolError, "Upload options must be a JSON object");
    }

    try {
        UploadOptions options = std::move(defaults);
        options.scheduler.worker_count = j.value("workers", options.scheduler.worker_count);
        options.scheduler.failure_tolerance = j.value("failure_tolerance", options.scheduler.failure_tolerance);
        options.retry.max_attempts = j.value("max_attempts", options.retry.max_attempts);
        options.retry.initial_backoff = std::chrono::milliseconds(
            j.value("initial_backoff_ms", options.retry.initial_backoff.count()));
        options.retry.max_backoff = std::chrono::milliseconds(
            j.value("max_backoff_ms", options.retry.max_backoff.count()));
        options.retry.multiplier = j.value("backoff_multiplier", options.retry.multiplier);
        options.attempt_timeout = std::chrono::milliseconds(
            j.value("attempt_timeout_ms", options.attempt_timeout.count()));
        options.max_passes = j.value("max_passes", options.max_passes);
        if (j.contains("chunk_size")) {
            options.chunk_size_hint = j["chunk_size"].get<std::uint64_t>();
        }
        if (j.contains("metadata")) {
            options.metadata = j["metadata"].get<std::map<std::string, std::string>>();
        }

        if (options.scheduler.worker_count == 0) {
            return Fail<UploadOptions>(ErrorCode::InvalidState, "workers must be at least 1");
        }
        if (options.retry.max_attempts == 0) {
            return Fail<UploadOptions>(ErrorCode::InvalidState, "max_attempts must be at least 1");
        }
        return Ok(std::move(options));
    } catch (const json::exception& e) {
        return Fail<UploadOptions>(ErrorCode::ProtocolError, std::string("Bad upload options: ") + e.what());
    }
}

json snapshot_to_json(const UploadSession::Snapshot& snapshot) {
    json j;
    j["session_id"] = snapshot.session_id;
    j["file"] = file_descriptor_to_json(snapshot.file);
    j["chunk_size"] = snapshot.chunk_size;
    j["total_chunks"] = snapshot.total_chunks;
    j["status"] = to_string(snapshot.status);
    j["uploaded_chunks"] = snapshot.uploaded_chunks;
    j["started_at"] = to_epoch_ms(snapshot.started_at);
    if (snapshot.ended_at) {
        j["ended_at"] = to_epoch_ms(*snapshot.ended_at);
    }
    if (snapshot.artifact_id) {
        j["artifact_id"] = *snapshot.artifact_id;
    }

    j["errors"] = json::array();
    for (const auto& record : snapshot.errors) {
        json e;
        e["code"] = to_string(record.code);
        e["message"] = record.message;
        e["timestamp"] = to_epoch_ms(record.timestamp);
        if (record.chunk_index) {
            e["chunk_index"] = *record.chunk_index;
        }
        j["errors"].push_back(e);
    }
    return j;
}

Result<UploadSession::Snapshot> snapshot_from_json(const json& j) {
    using Snapshot = UploadSession::Snapshot;

    if (!j.is_object()) {
        return Fail<Snapshot>(ErrorCode::ProtocolError, "Session journal must be a JSON object");
    }

    try {
        Snapshot snapshot;
        snapshot.session_id = j.at("session_id").get<std::string>();
        snapshot.file = file_descriptor_from_json(j.at("file"));
        snapshot.chunk_size = j.at("chunk_size").get<std::uint64_t>();
        snapshot.total_chunks = j.at("total_chunks").get<std::uint32_t>();

        auto status = upload_status_from_string(j.at("status").get<std::string>());
        if (!status) {
            return Fail<Snapshot>(ErrorCode::ProtocolError, "Unknown session status in journal");
        }
        snapshot.status = *status;
        snapshot.uploaded_chunks = j.value("uploaded_chunks", std::vector<ChunkIndex>{});
        snapshot.started_at = from_epoch_ms(j.value("started_at", static_cast<std::int64_t>(0)));
        if (j.contains("ended_at")) {
            snapshot.ended_at = from_epoch_ms(j["ended_at"].get<std::int64_t>());
        }
        if (j.contains("artifact_id")) {
            snapshot.artifact_id = j["artifact_id"].get<std::string>();
        }

        for (const auto& e : j.value("errors", json::array())) {
            ErrorRecord record;
            record.code = error_code_from_string(e.value("code", "")).value_or(ErrorCode::ProtocolError);
            record.message = e.value("message", "");
            record.timestamp = from_epoch_ms(e.value("timestamp", static_cast<std::int64_t>(0)));
            if (e.contains("chunk_index")) {
                record.chunk_index = e["chunk_index"].get<ChunkIndex>();
            }
            snapshot.errors.push_back(std::move(record));
        }
        return Ok(std::move(snapshot));
    } catch (const json::exception& e) {
        return Fail<Snapshot>(ErrorCode::ProtocolError, std::string("Malformed session journal: ") + e.what());
    }
}

} // namespace chunkup::upload
