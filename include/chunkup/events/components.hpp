/**
 * @file components.hpp
 * @brief Event-bus subscribers shared by the client and server binaries
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components react to upload events from here on
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkup::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Per-chunk events go to debug, session outcomes to info/warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionInitializedEvent>([](const SessionInitializedEvent& e) {
            spdlog::info("[SessionInitialized] session={} file={} bytes={} chunks={} chunk_size={}",
                         e.session_id, e.file_name, e.total_bytes, e.total_chunks, e.chunk_size);
        });

        bus_.subscribe<SessionStateChangedEvent>([](const SessionStateChangedEvent& e) {
            spdlog::debug("[StateChanged] session={} {} -> {}", e.session_id, e.from, e.to);
        });

        bus_.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) {
            spdlog::debug("[ChunkUploaded] session={} chunk={} bytes={} attempts={} duplicate={} progress={}/{}",
                          e.session_id, e.chunk_index, e.bytes, e.attempts, e.already_accepted,
                          e.uploaded_count, e.total_count);
        });

        bus_.subscribe<ChunkRetryEvent>([](const ChunkRetryEvent& e) {
            spdlog::warn("[ChunkRetry] session={} chunk={} attempt={} delay={}ms reason={}",
                         e.session_id, e.chunk_index, e.attempt, e.delay.count(), e.reason);
        });

        bus_.subscribe<ChunkFailedEvent>([](const ChunkFailedEvent& e) {
            spdlog::error("[ChunkFailed] session={} chunk={} code={} reason={}",
                          e.session_id, e.chunk_index, to_string(e.code), e.reason);
        });

        bus_.subscribe<ResumeReconciledEvent>([](const ResumeReconciledEvent& e) {
            spdlog::info("[Reconciled] session={} missing={}/{}",
                         e.session_id, e.missing_chunks, e.total_chunks);
        });

        bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] session={} artifact={} bytes={} duration={}ms",
                         e.session_id, e.artifact_id, e.total_bytes, e.duration.count());
        });

        bus_.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] session={} code={} reason={}",
                          e.session_id, to_string(e.code), e.reason);
        });

        bus_.subscribe<SessionCancelledEvent>([](const SessionCancelledEvent& e) {
            spdlog::info("[SessionCancelled] session={}", e.session_id);
        });

        bus_.subscribe<SessionInterruptedEvent>([](const SessionInterruptedEvent& e) {
            spdlog::warn("[SessionInterrupted] session={} progress={}/{}",
                         e.session_id, e.uploaded_count, e.total_count);
        });

        bus_.subscribe<ChunkAckNotifiedEvent>([](const ChunkAckNotifiedEvent& e) {
            spdlog::trace("[Push] session={} seq={} chunk_acked={}", e.session_id, e.sequence, e.chunk_index);
        });

        bus_.subscribe<AssemblyStartedEvent>([](const AssemblyStartedEvent& e) {
            spdlog::info("[Push] session={} seq={} assembly_started", e.session_id, e.sequence);
        });

        bus_.subscribe<AssemblyCompletedEvent>([](const AssemblyCompletedEvent& e) {
            spdlog::info("[Push] session={} seq={} assembly_completed artifact={}",
                         e.session_id, e.sequence, e.artifact_id);
        });

        bus_.subscribe<AssemblyFailedEvent>([](const AssemblyFailedEvent& e) {
            spdlog::warn("[Push] session={} seq={} assembly_failed reason={}",
                         e.session_id, e.sequence, e.reason);
        });

        bus_.subscribe<PushChannelLostEvent>([](const PushChannelLostEvent& e) {
            spdlog::warn("[PushChannelLost] session={} reason={}", e.session_id, e.reason);
        });

        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Upload server listening on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Upload server shutting down: {}", e.reason);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<UploadSessionOpenedEvent>([](const UploadSessionOpenedEvent& e) {
            spdlog::info("[SessionOpened] session={} file={} bytes={} chunks={}",
                         e.session_id, e.file_name, e.total_bytes, e.total_chunks);
        });

        bus_.subscribe<ChunkReceivedEvent>([](const ChunkReceivedEvent& e) {
            spdlog::debug("[ChunkReceived] session={} chunk={} bytes={} duplicate={}",
                          e.session_id, e.chunk_index, e.bytes, e.duplicate);
        });

        bus_.subscribe<ArtifactAssembledEvent>([](const ArtifactAssembledEvent& e) {
            spdlog::info("[ArtifactAssembled] session={} artifact={} bytes={} hash={}",
                         e.session_id, e.artifact_id, e.total_bytes, e.content_hash);
        });

        bus_.subscribe<UploadSessionClosedEvent>([](const UploadSessionClosedEvent& e) {
            spdlog::info("[SessionClosed] session={} reason={}", e.session_id, e.reason);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts chunk traffic and session outcomes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> chunks_uploaded{0};
        std::atomic<uint64_t> chunks_already_accepted{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> chunk_retries{0};
        std::atomic<uint64_t> chunks_failed{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> interruptions{0};
        std::atomic<uint64_t> push_events{0};
        std::atomic<uint64_t> chunks_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> artifacts_assembled{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) {
            stats_.chunks_uploaded++;
            if (e.already_accepted) {
                stats_.chunks_already_accepted++;
            } else {
                stats_.bytes_uploaded += e.bytes;
            }
        });

        bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent&) {
            stats_.chunk_retries++;
        });

        bus_.subscribe<ChunkFailedEvent>([this](const ChunkFailedEvent&) {
            stats_.chunks_failed++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.uploads_cancelled++;
        });

        bus_.subscribe<SessionInterruptedEvent>([this](const SessionInterruptedEvent&) {
            stats_.interruptions++;
        });

        bus_.subscribe<ChunkAckNotifiedEvent>([this](const ChunkAckNotifiedEvent&) {
            stats_.push_events++;
        });

        bus_.subscribe<AssemblyStartedEvent>([this](const AssemblyStartedEvent&) {
            stats_.push_events++;
        });

        bus_.subscribe<AssemblyCompletedEvent>([this](const AssemblyCompletedEvent&) {
            stats_.push_events++;
        });

        bus_.subscribe<AssemblyFailedEvent>([this](const AssemblyFailedEvent&) {
            stats_.push_events++;
        });

        bus_.subscribe<ChunkReceivedEvent>([this](const ChunkReceivedEvent& e) {
            if (!e.duplicate) {
                stats_.chunks_received++;
                stats_.bytes_received += e.bytes;
            }
        });

        bus_.subscribe<ArtifactAssembledEvent>([this](const ArtifactAssembledEvent&) {
            stats_.artifacts_assembled++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Chunks uploaded:   {}", stats_.chunks_uploaded.load());
        spdlog::info("  Already accepted:  {}", stats_.chunks_already_accepted.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("  Chunk retries:     {}", stats_.chunk_retries.load());
        spdlog::info("  Chunks failed:     {}", stats_.chunks_failed.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Interruptions:     {}", stats_.interruptions.load());
        spdlog::info("  Push events:       {}", stats_.push_events.load());
        spdlog::info("  Chunks received:   {}", stats_.chunks_received.load());
        spdlog::info("  Bytes received:    {}", stats_.bytes_received.load());
        spdlog::info("  Artifacts:         {}", stats_.artifacts_assembled.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunkup::events
