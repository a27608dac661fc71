/**
 * @file cancellation.hpp
 * @brief Cooperative stop signal shared by a session run and its workers
 *
 * A run owns one token. cancel() and interrupt() both stop dispatch; the
 * difference is only what the coordinator does afterwards (Cancelled vs
 * Resuming). Backoff sleeps use wait_for() so a stop request wakes them.
 */

#pragma once

#include "chunkup/core/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chunkup {

class CancellationToken {
public:
    enum class Reason {
        None,
        Cancelled,
        Interrupted
    };

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { request(Reason::Cancelled); }
    void interrupt() { request(Reason::Interrupted); }

    bool is_cancelled() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    Reason reason() const {
        std::lock_guard lock(mutex_);
        return reason_;
    }

    /**
     * @brief Sleep for up to @p timeout
     * @return false if the token fired before the timeout elapsed
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, timeout, [this]() {
            return stopped_.load(std::memory_order_acquire);
        });
    }

private:
    void request(Reason reason) {
        {
            std::lock_guard lock(mutex_);
            // Cancel overrides an earlier interrupt, never the reverse
            if (reason_ == Reason::None || reason == Reason::Cancelled) {
                reason_ = reason;
            }
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    std::atomic<bool> stopped_{false};
    Reason reason_ = Reason::None;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

/// Error describing why @p token stopped a run
inline Error stop_error(const CancellationToken& token) {
    if (token.reason() == CancellationToken::Reason::Interrupted) {
        return make_error(ErrorCode::Interrupted, "Upload interrupted");
    }
    return make_error(ErrorCode::Cancelled, "Upload cancelled");
}

} // namespace chunkup
