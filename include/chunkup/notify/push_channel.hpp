#pragma once

#include "chunkup/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::notify {

enum class ProgressEventType {
    ChunkAcked,
    AssemblyStarted,
    AssemblyCompleted,
    AssemblyFailed
};

const char* to_string(ProgressEventType type);
std::optional<ProgressEventType> progress_event_type_from_string(const std::string& name);

/**
 * @brief One server-side progress notification
 *
 * Sequence numbers are per session, start at 1 and increase by one for
 * every event the server records.
 */
struct ProgressEvent {
    std::uint64_t sequence = 0;
    ProgressEventType type = ProgressEventType::ChunkAcked;
    std::string session_id;
    std::optional<std::uint32_t> chunk_index;   ///< ChunkAcked
    std::optional<std::string> artifact_id;     ///< AssemblyCompleted
    std::optional<std::string> reason;          ///< AssemblyFailed
};

nlohmann::json progress_event_to_json(const ProgressEvent& event);
Result<ProgressEvent> progress_event_from_json(const nlohmann::json& j);

/**
 * @brief Server-to-client event stream scoped to one session
 *
 * receive() blocks for at most @p wait and returns the events recorded
 * since the previous successful call (possibly none). Only one thread
 * reads from a channel.
 */
class PushChannel {
public:
    virtual ~PushChannel() = default;

    virtual Result<std::vector<ProgressEvent>> receive(std::chrono::milliseconds wait) = 0;

    virtual void close() = 0;
};

using ChannelConnector =
    std::function<Result<std::unique_ptr<PushChannel>>(const std::string& session_id)>;

} // namespace chunkup::notify
