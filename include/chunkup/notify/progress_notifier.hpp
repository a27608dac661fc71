#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/notify/push_channel.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace chunkup::notify {

/**
 * @brief Forwards a session's push channel onto the event bus
 *
 * A single reader thread polls the channel and emits ChunkAckNotifiedEvent,
 * AssemblyStartedEvent, AssemblyCompletedEvent and AssemblyFailedEvent in
 * sequence order, dropping anything at or below the last delivered
 * sequence, and each chunk's ack only once. The notifier never touches
 * session state.
 *
 * After max_consecutive_errors failed receives in a row it emits
 * PushChannelLostEvent. With a fallback set, the reader swaps in the
 * fallback channel (numbered after the last delivered sequence) and keeps
 * going; without one, or when the fallback is lost too, the reader exits.
 */
class ProgressNotifier {
public:
    /// Builds a replacement channel whose events start after @p last_sequence
    using Fallback = std::function<std::unique_ptr<PushChannel>(std::uint64_t last_sequence)>;

    struct Options {
        std::chrono::milliseconds poll_wait{500};
        std::chrono::milliseconds error_backoff{200};
        std::uint32_t max_consecutive_errors = 5;
    };

    ProgressNotifier(std::string session_id,
                     std::unique_ptr<PushChannel> channel,
                     events::EventBus& bus);
    ProgressNotifier(std::string session_id,
                     std::unique_ptr<PushChannel> channel,
                     events::EventBus& bus,
                     Options options);
    ~ProgressNotifier();

    ProgressNotifier(const ProgressNotifier&) = delete;
    ProgressNotifier& operator=(const ProgressNotifier&) = delete;

    /// Must be called before start()
    void set_fallback(Fallback fallback) { fallback_ = std::move(fallback); }

    void start();

    /// Flush pending events once, close the channel and join the reader
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] bool channel_lost() const noexcept { return lost_.load(); }
    [[nodiscard]] bool on_fallback() const noexcept { return on_fallback_.load(); }
    [[nodiscard]] std::uint64_t last_sequence() const noexcept { return last_sequence_.load(); }

    /// Emit the not-yet-seen events of @p batch; returns how many were emitted
    std::size_t deliver(std::vector<ProgressEvent> batch);

private:
    void run();

    std::string session_id_;
    std::unique_ptr<PushChannel> channel_;
    events::EventBus& bus_;
    Options options_;
    Fallback fallback_;
    std::set<std::uint32_t> acked_chunks_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> lost_{false};
    std::atomic<bool> on_fallback_{false};
    std::atomic<std::uint64_t> last_sequence_{0};
    std::thread reader_;
};

} // namespace chunkup::notify
