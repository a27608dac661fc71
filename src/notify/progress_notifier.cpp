#include "chunkup/notify/progress_notifier.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkup::notify {

ProgressNotifier::ProgressNotifier(std::string session_id,
                                   std::unique_ptr<PushChannel> channel,
                                   events::EventBus& bus)
    : ProgressNotifier(std::move(session_id), std::move(channel), bus, Options{}) {}

ProgressNotifier::ProgressNotifier(std::string session_id,
                                   std::unique_ptr<PushChannel> channel,
                                   events::EventBus& bus,
                                   Options options)
    : session_id_(std::move(session_id)),
      channel_(std::move(channel)),
      bus_(bus),
      options_(options) {}

ProgressNotifier::~ProgressNotifier() {
    stop();
}

void ProgressNotifier::start() {
    if (running_.exchange(true)) {
        return;
    }
    stop_requested_ = false;
    reader_ = std::thread([this]() { run(); });
}

void ProgressNotifier::stop() {
    stop_requested_ = true;
    if (reader_.joinable()) {
        reader_.join();
    }
    running_ = false;
}

std::size_t ProgressNotifier::deliver(std::vector<ProgressEvent> batch) {
    std::sort(batch.begin(), batch.end(), [](const ProgressEvent& a, const ProgressEvent& b) {
        return a.sequence < b.sequence;
    });

    std::size_t emitted = 0;
    for (const auto& event : batch) {
        if (event.sequence <= last_sequence_.load()) {
            continue;
        }
        last_sequence_ = event.sequence;
        if (event.type == ProgressEventType::ChunkAcked
            && !acked_chunks_.insert(event.chunk_index.value_or(0)).second) {
            continue;
        }
        ++emitted;

        switch (event.type) {
            case ProgressEventType::ChunkAcked:
                bus_.emit(events::ChunkAckNotifiedEvent{session_id_, event.chunk_index.value_or(0), event.sequence});
                break;
            case ProgressEventType::AssemblyStarted:
                bus_.emit(events::AssemblyStartedEvent{session_id_, event.sequence});
                break;
            case ProgressEventType::AssemblyCompleted:
                bus_.emit(events::AssemblyCompletedEvent{session_id_, event.artifact_id.value_or(""), event.sequence});
                break;
            case ProgressEventType::AssemblyFailed:
                bus_.emit(events::AssemblyFailedEvent{session_id_, event.reason.value_or(""), event.sequence});
                break;
        }
    }
    return emitted;
}

void ProgressNotifier::run() {
    std::uint32_t consecutive_errors = 0;

    while (true) {
        // One last zero-wait poll after stop() so late events still get out
        const bool final_pass = stop_requested_.load();
        auto received = channel_->receive(final_pass ? std::chrono::milliseconds{0} : options_.poll_wait);

        if (received.is_ok()) {
            consecutive_errors = 0;
            deliver(std::move(received.value()));
        } else if (++consecutive_errors >= options_.max_consecutive_errors) {
            spdlog::warn("Push channel for {} lost after {} errors: {}",
                         session_id_, consecutive_errors, received.error().message);
            bus_.emit(events::PushChannelLostEvent{session_id_, received.error().message});

            if (fallback_ && !final_pass) {
                auto replacement = fallback_(last_sequence_.load());
                fallback_ = nullptr;
                if (replacement) {
                    spdlog::info("Progress for {} continues on the fallback channel", session_id_);
                    channel_->close();
                    channel_ = std::move(replacement);
                    on_fallback_ = true;
                    consecutive_errors = 0;
                    continue;
                }
            }
            lost_ = true;
            break;
        } else if (!final_pass) {
            std::this_thread::sleep_for(options_.error_backoff);
        }

        if (final_pass) {
            break;
        }
    }

    channel_->close();
}

} // namespace chunkup::notify
