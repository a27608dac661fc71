#include "chunkup/notify/push_channel.hpp"

namespace chunkup::notify {

using json = nlohmann::json;

const char* to_string(ProgressEventType type) {
    switch (type) {
        case ProgressEventType::ChunkAcked: return "chunk_acked";
        case ProgressEventType::AssemblyStarted: return "assembly_started";
        case ProgressEventType::AssemblyCompleted: return "assembly_completed";
        case ProgressEventType::AssemblyFailed: return "assembly_failed";
    }
    return "unknown";
}

std::optional<ProgressEventType> progress_event_type_from_string(const std::string& name) {
    for (auto type : {ProgressEventType::ChunkAcked, ProgressEventType::AssemblyStarted,
                      ProgressEventType::AssemblyCompleted, ProgressEventType::AssemblyFailed}) {
        if (name == to_string(type)) {
            return type;
        }
    }
    return std::nullopt;
}

json progress_event_to_json(const ProgressEvent& event) {
    json j;
    j["sequence"] = event.sequence;
    j["type"] = to_string(event.type);
    j["session_id"] = event.session_id;
    if (event.chunk_index) {
        j["chunk_index"] = *event.chunk_index;
    }
    if (event.artifact_id) {
        j["artifact_id"] = *event.artifact_id;
    }
    if (event.reason) {
        j["reason"] = *event.reason;
    }
    return j;
}

Result<ProgressEvent> progress_event_from_json(const json& j) {
    if (!j.is_object()) {
        return Fail<ProgressEvent>(ErrorCode::ProtocolError, "Progress event must be an object");
    }

    try {
        ProgressEvent event;
        event.sequence = j.at("sequence").get<std::uint64_t>();
        auto type = progress_event_type_from_string(j.at("type").get<std::string>());
        if (!type) {
            return Fail<ProgressEvent>(ErrorCode::ProtocolError, "Unknown progress event type");
        }
        event.type = *type;
        event.session_id = j.value("session_id", "");
        if (j.contains("chunk_index")) {
            event.chunk_index = j["chunk_index"].get<std::uint32_t>();
        }
        if (j.contains("artifact_id")) {
            event.artifact_id = j["artifact_id"].get<std::string>();
        }
        if (j.contains("reason")) {
            event.reason = j["reason"].get<std::string>();
        }
        if (event.type == ProgressEventType::ChunkAcked && !event.chunk_index) {
            return Fail<ProgressEvent>(ErrorCode::ProtocolError, "chunk_acked event without chunk_index");
        }
        return Ok(std::move(event));
    } catch (const json::exception& e) {
        return Fail<ProgressEvent>(ErrorCode::ProtocolError, std::string("Malformed progress event: ") + e.what());
    }
}

} // namespace chunkup::notify
