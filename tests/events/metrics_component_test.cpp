#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace chunkup::events;

TEST(MetricsComponentTest, TracksClientChunkTraffic) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ChunkUploadedEvent{"session-1", 0, 1024, 1, false, 1, 3});
    bus.emit(ChunkUploadedEvent{"session-1", 1, 1024, 2, true, 2, 3});
    bus.emit(ChunkRetryEvent{"session-1", 1, 1, std::chrono::milliseconds{200}, "timeout"});
    bus.emit(ChunkFailedEvent{"session-1", 2, chunkup::ErrorCode::ChunkPermanentError, "rejected"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.chunks_uploaded.load(), 2u);
    EXPECT_EQ(stats.chunks_already_accepted.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1024u);
    EXPECT_EQ(stats.chunk_retries.load(), 1u);
    EXPECT_EQ(stats.chunks_failed.load(), 1u);
}

TEST(MetricsComponentTest, TracksSessionOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadCompletedEvent{"a", "artifact-1", 10, std::chrono::milliseconds{5}});
    bus.emit(UploadFailedEvent{"b", chunkup::ErrorCode::SessionExpired, "gone"});
    bus.emit(SessionCancelledEvent{"c"});
    bus.emit(SessionInterruptedEvent{"d", 6, 10});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
    EXPECT_EQ(stats.interruptions.load(), 1u);
}

TEST(MetricsComponentTest, TracksPushAndServerEvents) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ChunkAckNotifiedEvent{"s", 0, 1});
    bus.emit(AssemblyStartedEvent{"s", 2});
    bus.emit(AssemblyCompletedEvent{"s", "artifact-1", 3});
    bus.emit(ChunkReceivedEvent{"s", 0, 512, false});
    bus.emit(ChunkReceivedEvent{"s", 0, 512, true});
    bus.emit(ArtifactAssembledEvent{"s", "artifact-1", 512, "hash"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.push_events.load(), 3u);
    EXPECT_EQ(stats.chunks_received.load(), 1u);
    EXPECT_EQ(stats.bytes_received.load(), 512u);
    EXPECT_EQ(stats.artifacts_assembled.load(), 1u);
}
