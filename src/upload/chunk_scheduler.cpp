#include "chunkup/upload/chunk_scheduler.hpp"
#include "chunkup/events/event_queue.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/upload/transmission_worker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace chunkup::upload {
namespace {

std::string join_indices(const std::vector<ChunkIndex>& indices) {
    std::string text;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            text += ",";
        }
        text += std::to_string(indices[i]);
    }
    return text;
}

} // namespace

ChunkScheduler::ChunkScheduler(UploadApi& api,
                               const ChunkSource& source,
                               UploadOptions options,
                               events::EventBus* bus)
    : api_(api), source_(source), options_(std::move(options)), bus_(bus) {}

Result<ScheduleReport> ChunkScheduler::schedule(UploadSession& session,
                                                const std::vector<ChunkIndex>& pending,
                                                const ProgressCallback& on_progress,
                                                const CancellationToken& cancel) {
    ScheduleReport report;
    if (pending.empty()) {
        return Ok(report);
    }

    events::ThreadSafeQueue<ChunkIndex> queue;
    for (auto index : pending) {
        queue.push(index);
    }
    queue.shutdown();  // Workers exit once the queue drains

    const TransmissionWorker worker(api_, source_, options_.retry, options_.attempt_timeout, bus_);
    const std::size_t tolerance = options_.scheduler.failure_tolerance;
    const std::string& session_id = session.session_id();

    std::atomic<bool> stop{false};
    std::atomic<std::size_t> active{0};
    std::atomic<std::size_t> peak{0};
    std::mutex report_mutex;
    std::optional<Error> fatal;

    auto halt = [&](std::optional<Error> reason) {
        stop.store(true);
        if (reason) {
            std::lock_guard lock(report_mutex);
            if (!fatal) {
                fatal = std::move(reason);
            }
        }
    };

    auto on_failure = [&](ChunkIndex index, const Error& error) {
        session.record_error(error);
        if (bus_) {
            bus_->emit(events::ChunkFailedEvent{session_id, index, error.code, error.message});
        }
        std::size_t failed_now = 0;
        {
            std::lock_guard lock(report_mutex);
            report.failed_indices.push_back(index);
            failed_now = ++report.failed;
        }
        if (failed_now > tolerance) {
            halt(std::nullopt);
        }
    };

    auto run_worker = [&]() {
        while (!stop.load() && !cancel.is_cancelled()) {
            auto next = queue.pop();
            if (!next) {
                break;
            }
            const ChunkIndex index = *next;

            auto chunk = source_.range(index);
            if (chunk.is_error()) {
                on_failure(index, make_chunk_error(ErrorCode::ChunkPermanentError, index, chunk.error().message));
                continue;
            }

            const std::size_t now_active = ++active;
            std::size_t seen = peak.load();
            while (now_active > seen && !peak.compare_exchange_weak(seen, now_active)) {
            }

            auto ack = worker.send(session_id, chunk.value(), &cancel);
            --active;

            if (ack.is_error()) {
                const auto& error = ack.error();
                switch (error.code) {
                    case ErrorCode::SessionExpired:
                        session.record_error(error);
                        halt(error);
                        break;
                    case ErrorCode::Cancelled:
                    case ErrorCode::Interrupted:
                        halt(std::nullopt);
                        break;
                    default:
                        on_failure(index, error);
                        break;
                }
                continue;
            }

            auto recorded = session.record_chunk(index);
            if (recorded.is_error()) {
                // Session went terminal underneath us; the late ack is dropped
                spdlog::debug("Dropping ack for chunk {} of {}: {}", index, session_id, recorded.error().message);
                halt(std::nullopt);
                continue;
            }

            const std::size_t uploaded = recorded.value();
            const std::size_t total = session.total_chunks();
            {
                std::lock_guard lock(report_mutex);
                ++report.acked;
            }
            if (bus_) {
                bus_->emit(events::ChunkUploadedEvent{
                    session_id, index, chunk.value().bytes.length, ack.value().attempts,
                    ack.value().status == ChunkAckStatus::AlreadyAccepted, uploaded, total});
            }
            if (on_progress) {
                try {
                    on_progress(ProgressUpdate{index, uploaded, total});
                } catch (const std::exception& e) {
                    spdlog::error("Progress callback threw for chunk {}: {}", index, e.what());
                }
            }
        }
    };

    const std::size_t thread_count = std::min<std::size_t>(
        std::max<std::size_t>(1, options_.scheduler.worker_count), pending.size());

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(run_worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const std::size_t dropped = queue.clear();
    report.peak_concurrency = peak.load();
    std::sort(report.failed_indices.begin(), report.failed_indices.end());

    spdlog::debug("Scheduling pass for {} done: acked={} failed={} dropped={} peak={}",
                  session_id, report.acked, report.failed, dropped, report.peak_concurrency);

    if (fatal) {
        return Err<ScheduleReport>(*fatal);
    }
    if (cancel.is_cancelled()) {
        return Err<ScheduleReport>(stop_error(cancel));
    }
    if (report.failed > tolerance) {
        return Fail<ScheduleReport>(ErrorCode::ChunkPermanentError,
                                    std::to_string(report.failed) + " chunk(s) failed permanently: ["
                                    + join_indices(report.failed_indices) + "]");
    }
    if (stop.load()) {
        return Fail<ScheduleReport>(ErrorCode::InvalidState,
                                    "Session " + session_id + " ended while chunks were in flight");
    }
    return Ok(report);
}

} // namespace chunkup::upload
