/**
 * @file events.hpp
 * @brief Event types emitted by the upload client, notifier and server
 *
 * NAMING CONVENTION:
 * - Events are past-tense: ChunkUploadedEvent, SessionCancelledEvent
 * - Every event carries the session it belongs to and an emit timestamp
 */

#pragma once

#include "chunkup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Client session events
// ════════════════════════════════════════════════════════

/**
 * @brief Server accepted a new session and the chunk layout is fixed
 *
 * WHO EMITS: SessionCoordinator::initialize
 */
struct SessionInitializedEvent {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunk_size = 0;
    Clock::time_point timestamp = Clock::now();
};

struct SessionStateChangedEvent {
    std::string session_id;
    std::string from;
    std::string to;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief A worker got a synchronous ack for one chunk
 *
 * WHO EMITS: ChunkScheduler, after the index is recorded on the session
 *
 * WHO SUBSCRIBES:
 * - Logger
 * - Metrics (chunks and bytes sent)
 */
struct ChunkUploadedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 1;
    bool already_accepted = false;
    std::size_t uploaded_count = 0;
    std::size_t total_count = 0;
    Clock::time_point timestamp = Clock::now();
};

/// One attempt failed transiently and the worker is backing off
struct ChunkRetryEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

struct ChunkFailedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    ErrorCode code = ErrorCode::ChunkPermanentError;
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

struct ResumeReconciledEvent {
    std::string session_id;
    std::uint32_t total_chunks = 0;
    std::size_t missing_chunks = 0;
    Clock::time_point timestamp = Clock::now();
};

struct UploadCompletedEvent {
    std::string session_id;
    std::string artifact_id;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    Clock::time_point timestamp = Clock::now();
};

struct UploadFailedEvent {
    std::string session_id;
    ErrorCode code = ErrorCode::ChunkPermanentError;
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

struct SessionCancelledEvent {
    std::string session_id;
    Clock::time_point timestamp = Clock::now();
};

struct SessionInterruptedEvent {
    std::string session_id;
    std::size_t uploaded_count = 0;
    std::size_t total_count = 0;
    Clock::time_point timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Push channel events (advisory, never change session state)
// ════════════════════════════════════════════════════════

struct ChunkAckNotifiedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t sequence = 0;
    Clock::time_point timestamp = Clock::now();
};

struct AssemblyStartedEvent {
    std::string session_id;
    std::uint64_t sequence = 0;
    Clock::time_point timestamp = Clock::now();
};

struct AssemblyCompletedEvent {
    std::string session_id;
    std::string artifact_id;
    std::uint64_t sequence = 0;
    Clock::time_point timestamp = Clock::now();
};

struct AssemblyFailedEvent {
    std::string session_id;
    std::string reason;
    std::uint64_t sequence = 0;
    Clock::time_point timestamp = Clock::now();
};

/// Receive kept failing; the notifier stopped but the upload continues
struct PushChannelLostEvent {
    std::string session_id;
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

// ════════════════════════════════════════════════════════
// Server events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port = 0;
    Clock::time_point timestamp = Clock::now();
};

struct ServerShuttingDownEvent {
    std::string reason;
    Clock::time_point timestamp = Clock::now();
};

struct UploadSessionOpenedEvent {
    std::string session_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint32_t total_chunks = 0;
    Clock::time_point timestamp = Clock::now();
};

/**
 * @brief Server durably staged one chunk
 *
 * WHO EMITS: UploadServer::accept_chunk (duplicate == true for re-sends)
 */
struct ChunkReceivedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes = 0;
    bool duplicate = false;
    Clock::time_point timestamp = Clock::now();
};

struct ArtifactAssembledEvent {
    std::string session_id;
    std::string artifact_id;
    std::uint64_t total_bytes = 0;
    std::string content_hash;
    Clock::time_point timestamp = Clock::now();
};

struct UploadSessionClosedEvent {
    std::string session_id;
    std::string reason;  // "cancelled", "expired"
    Clock::time_point timestamp = Clock::now();
};

} // namespace chunkup::events
