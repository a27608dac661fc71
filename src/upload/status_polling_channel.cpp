#include "chunkup/upload/status_polling_channel.hpp"

#include <thread>

namespace chunkup::upload {

using Events = std::vector<notify::ProgressEvent>;

notify::ProgressEvent StatusPollingChannel::next(notify::ProgressEventType type) {
    notify::ProgressEvent event;
    event.sequence = ++sequence_;
    event.type = type;
    event.session_id = session_id_;
    return event;
}

Result<Events> StatusPollingChannel::receive(std::chrono::milliseconds wait) {
    if (closed_) {
        return Fail<Events>(ErrorCode::InvalidState, "Channel closed");
    }

    auto remote = api_.status(session_id_);
    if (remote.is_error()) {
        return Err<Events>(remote.error());
    }
    const auto& status = remote.value();
    if (status.state == RemoteSessionState::Expired || status.state == RemoteSessionState::Cancelled) {
        return Fail<Events>(ErrorCode::SessionExpired,
                            "Session " + session_id_ + " is " + to_string(status.state));
    }

    auto held = accepted_chunks(status);
    if (held.is_error()) {
        return Err<Events>(held.error());
    }

    Events events;
    for (auto index : held.value()) {
        if (seen_.insert(index).second) {
            auto acked = next(notify::ProgressEventType::ChunkAcked);
            acked.chunk_index = index;
            events.push_back(std::move(acked));
        }
    }

    const bool assembling = status.state == RemoteSessionState::Assembling;
    const bool done = status.state == RemoteSessionState::Completed || status.state == RemoteSessionState::Failed;
    if ((assembling || done) && !started_) {
        started_ = true;
        events.push_back(next(notify::ProgressEventType::AssemblyStarted));
    }
    if (done && !finished_) {
        finished_ = true;
        if (status.state == RemoteSessionState::Completed) {
            auto completed = next(notify::ProgressEventType::AssemblyCompleted);
            completed.artifact_id = status.artifact_id.value_or("");
            events.push_back(std::move(completed));
        } else {
            auto failed = next(notify::ProgressEventType::AssemblyFailed);
            failed.reason = "Server reports the session failed";
            events.push_back(std::move(failed));
        }
    }

    if (events.empty() && wait.count() > 0) {
        std::this_thread::sleep_for(wait);
    }
    return Ok(std::move(events));
}

} // namespace chunkup::upload
