#include "chunkup/core/hash.hpp"
#include "chunkup/events/events.hpp"
#include "chunkup/server/upload_server.hpp"

#include "../local_server.hpp"
#include "../test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

using namespace chunkup;
using namespace chunkup::server;
using chunkup::testing::TempDir;
using chunkup::testing::make_bytes;
using chunkup::testing::read_file;
using chunkup::testing::server_options_in;
using upload::RemoteSessionState;

namespace {

/// Manually advanced wall clock
class FakeClock {
public:
    std::chrono::system_clock::time_point now() const {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds by) {
        std::lock_guard lock(mutex_);
        now_ += by;
    }

    ClockFn fn() {
        return [this]() { return now(); };
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_ = std::chrono::system_clock::now();
};

class UploadServerTest : public ::testing::Test {
protected:
    UploadServerTest() : server_(options(), bus_, clock_.fn()) {}

    ServerOptions options() const {
        auto opts = server_options_in(dir_, 1000);
        opts.session_ttl = std::chrono::seconds{60};
        opts.max_file_size = 100000;
        opts.min_chunk_size = 10;
        opts.max_chunk_size = 5000;
        return opts;
    }

    std::string open(const std::vector<std::uint8_t>& data, bool with_hash = true) {
        upload::InitializeRequest request;
        request.file.name = "server.bin";
        request.file.total_size_bytes = data.size();
        if (with_hash) {
            request.file.content_hash = sha256_hex(data).value();
        }
        auto init = server_.initialize(request);
        EXPECT_TRUE(init.is_ok());
        return init.is_ok() ? init.value().session_id : std::string{};
    }

    ServerResult<upload::PutChunkResponse> put(const std::string& id,
                                               const std::vector<std::uint8_t>& data,
                                               std::uint32_t index) {
        const std::size_t begin = index * 1000;
        const std::size_t end = std::min<std::size_t>(begin + 1000, data.size());
        return server_.accept_chunk(id, index, std::vector<std::uint8_t>(data.begin() + begin, data.begin() + end));
    }

    TempDir dir_;
    FakeClock clock_;
    events::EventBus bus_;
    UploadServer server_;
};

} // namespace

TEST_F(UploadServerTest, InitializeComputesLayout) {
    upload::InitializeRequest request;
    request.file.name = "layout.bin";
    request.file.total_size_bytes = 2500;
    auto init = server_.initialize(request);

    ASSERT_TRUE(init.is_ok());
    EXPECT_EQ(init.value().chunk_size, 1000u);
    EXPECT_EQ(init.value().total_chunks, 3u);
    EXPECT_FALSE(init.value().session_id.empty());
    EXPECT_EQ(init.value().expires_at.back(), 'Z');
}

TEST_F(UploadServerTest, ChunkSizeHintWithinBoundsIsHonoured) {
    upload::InitializeRequest request;
    request.file.name = "hint.bin";
    request.file.total_size_bytes = 2500;
    request.chunk_size = 500;
    auto init = server_.initialize(request);
    ASSERT_TRUE(init.is_ok());
    EXPECT_EQ(init.value().total_chunks, 5u);

    request.chunk_size = 5;
    auto too_small = server_.initialize(request);
    ASSERT_TRUE(too_small.is_error());
    EXPECT_EQ(too_small.error().code, ServerErrorCode::BadRequest);
}

TEST_F(UploadServerTest, InitializeValidatesFile) {
    upload::InitializeRequest request;
    request.file.total_size_bytes = 10;
    EXPECT_EQ(server_.initialize(request).error().code, ServerErrorCode::BadRequest);

    request.file.name = "big.bin";
    request.file.total_size_bytes = 200000;
    EXPECT_EQ(server_.initialize(request).error().code, ServerErrorCode::TooLarge);

    request.file.total_size_bytes = 0;
    EXPECT_EQ(server_.initialize(request).error().code, ServerErrorCode::BadRequest);
}

TEST_F(UploadServerTest, ChunkAcceptanceIsIdempotent) {
    const auto data = make_bytes(2500);
    const auto id = open(data);

    auto first = put(id, data, 1);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().status, upload::ChunkAckStatus::Accepted);
    EXPECT_EQ(first.value().uploaded_count, 1u);

    auto second = put(id, data, 1);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().status, upload::ChunkAckStatus::AlreadyAccepted);
    EXPECT_EQ(second.value().uploaded_count, 1u);

    auto metrics = server_.metrics();
    EXPECT_EQ(metrics.chunks_accepted, 1u);
    EXPECT_EQ(metrics.duplicate_chunks, 1u);
    EXPECT_EQ(metrics.bytes_received, 1000u);
}

TEST_F(UploadServerTest, ChunkValidation) {
    const auto data = make_bytes(2500);
    const auto id = open(data);

    auto out_of_range = server_.accept_chunk(id, 3, make_bytes(500));
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error().code, ServerErrorCode::BadRequest);

    auto wrong_size = server_.accept_chunk(id, 2, make_bytes(400));
    ASSERT_TRUE(wrong_size.is_error());
    EXPECT_EQ(wrong_size.error().code, ServerErrorCode::BadRequest);

    auto unknown = server_.accept_chunk("session-404", 0, make_bytes(1000));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ServerErrorCode::NotFound);
}

TEST_F(UploadServerTest, StatusListsUploadedAndMissing) {
    const auto data = make_bytes(5000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());
    ASSERT_TRUE(put(id, data, 3).is_ok());

    auto status = server_.status(id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, RemoteSessionState::Active);
    ASSERT_TRUE(status.value().uploaded_chunks && status.value().missing_chunks);
    EXPECT_EQ(*status.value().uploaded_chunks, std::vector<std::uint32_t>({0, 3}));
    EXPECT_EQ(*status.value().missing_chunks, std::vector<std::uint32_t>({1, 2, 4}));
    EXPECT_FALSE(status.value().artifact_id.has_value());
}

TEST_F(UploadServerTest, FinalizeIncompleteIsConflictWithMissingList) {
    const auto data = make_bytes(3000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 1).is_ok());

    auto result = server_.finalize(id);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ServerErrorCode::Conflict);
    EXPECT_EQ(result.error().missing_chunks, std::vector<std::uint32_t>({0, 2}));
}

TEST_F(UploadServerTest, FinalizeAssemblesAndIsIdempotent) {
    const auto data = make_bytes(2500, 7);
    const auto id = open(data);
    for (std::uint32_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(put(id, data, i).is_ok());
    }

    std::atomic<int> assembled{0};
    bus_.subscribe<events::ArtifactAssembledEvent>([&](const events::ArtifactAssembledEvent&) { assembled++; });

    auto first = server_.finalize(id);
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    auto second = server_.finalize(id);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().artifact_id, second.value().artifact_id);
    EXPECT_EQ(assembled.load(), 1);

    auto path = server_.artifact_path(first.value().artifact_id);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(read_file(*path), data);

    auto status = server_.status(id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, RemoteSessionState::Completed);
    EXPECT_EQ(status.value().artifact_id, first.value().artifact_id);
}

TEST_F(UploadServerTest, ChunkAfterCompletionIsDuplicate) {
    const auto data = make_bytes(1000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());
    ASSERT_TRUE(server_.finalize(id).is_ok());

    auto late = put(id, data, 0);
    ASSERT_TRUE(late.is_ok());
    EXPECT_EQ(late.value().status, upload::ChunkAckStatus::AlreadyAccepted);
}

TEST_F(UploadServerTest, HashMismatchFailsSession) {
    upload::InitializeRequest request;
    request.file.name = "bad.bin";
    request.file.total_size_bytes = 1000;
    request.file.content_hash = "ffffffffffffffff";
    auto init = server_.initialize(request);
    ASSERT_TRUE(init.is_ok());
    const auto id = init.value().session_id;
    ASSERT_TRUE(server_.accept_chunk(id, 0, make_bytes(1000)).is_ok());

    auto result = server_.finalize(id);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ServerErrorCode::AssemblyFailed);

    auto again = server_.finalize(id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ServerErrorCode::AssemblyFailed);
}

TEST_F(UploadServerTest, CancelClosesSession) {
    const auto data = make_bytes(2000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());

    ASSERT_TRUE(server_.cancel(id).is_ok());
    ASSERT_TRUE(server_.cancel(id).is_ok());

    auto chunk = put(id, data, 1);
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ServerErrorCode::Gone);

    auto finalize = server_.finalize(id);
    ASSERT_TRUE(finalize.is_error());
    EXPECT_EQ(finalize.error().code, ServerErrorCode::Gone);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "staging" / id));
}

TEST_F(UploadServerTest, CancelAfterCompletionIsConflict) {
    const auto data = make_bytes(1000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());
    ASSERT_TRUE(server_.finalize(id).is_ok());

    auto cancelled = server_.cancel(id);
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_EQ(cancelled.error().code, ServerErrorCode::Conflict);
}

TEST_F(UploadServerTest, SessionExpiresAfterTtl) {
    const auto data = make_bytes(2000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());

    clock_.advance(std::chrono::seconds{61});

    auto chunk = put(id, data, 1);
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ServerErrorCode::Gone);

    auto status = server_.status(id);
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().code, ServerErrorCode::Gone);
}

TEST_F(UploadServerTest, SweepExpiresThenForgets) {
    const auto data = make_bytes(2000);
    const auto id = open(data);
    ASSERT_TRUE(put(id, data, 0).is_ok());
    ASSERT_TRUE(std::filesystem::exists(dir_.path() / "staging" / id));

    std::atomic<int> closed{0};
    bus_.subscribe<events::UploadSessionClosedEvent>([&](const events::UploadSessionClosedEvent& e) {
        EXPECT_EQ(e.reason, "expired");
        closed++;
    });

    EXPECT_EQ(server_.sweep(), 0u);

    clock_.advance(std::chrono::seconds{61});
    EXPECT_EQ(server_.sweep(), 1u);
    EXPECT_EQ(closed.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "staging" / id));
    EXPECT_EQ(server_.metrics().sessions_by_state["expired"], 1u);

    // One more TTL later the record itself is dropped
    clock_.advance(std::chrono::seconds{61});
    EXPECT_EQ(server_.sweep(), 1u);
    auto status = server_.status(id);
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().code, ServerErrorCode::NotFound);
}

TEST_F(UploadServerTest, EventLogIsSequencedPerSession) {
    const auto data = make_bytes(2000);
    const auto id = open(data, false);
    ASSERT_TRUE(put(id, data, 1).is_ok());
    ASSERT_TRUE(put(id, data, 0).is_ok());
    ASSERT_TRUE(server_.finalize(id).is_ok());

    auto all = server_.events_after(id, 0, std::chrono::milliseconds{0});
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 4u);
    EXPECT_EQ(all.value()[0].type, notify::ProgressEventType::ChunkAcked);
    EXPECT_EQ(all.value()[0].chunk_index, std::optional<std::uint32_t>(1));
    EXPECT_EQ(all.value()[2].type, notify::ProgressEventType::AssemblyStarted);
    EXPECT_EQ(all.value()[3].type, notify::ProgressEventType::AssemblyCompleted);
    for (std::size_t i = 0; i < all.value().size(); ++i) {
        EXPECT_EQ(all.value()[i].sequence, i + 1);
        EXPECT_EQ(all.value()[i].session_id, id);
    }

    auto tail = server_.events_after(id, 3, std::chrono::milliseconds{0});
    ASSERT_TRUE(tail.is_ok());
    ASSERT_EQ(tail.value().size(), 1u);
    EXPECT_EQ(tail.value()[0].sequence, 4u);
}

TEST_F(UploadServerTest, EventWaitWakesOnNewChunk) {
    const auto data = make_bytes(2000);
    const auto id = open(data);

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        EXPECT_TRUE(put(id, data, 0).is_ok());
    });

    const auto started = std::chrono::steady_clock::now();
    auto batch = server_.events_after(id, 0, std::chrono::milliseconds{5000});
    const auto waited = std::chrono::steady_clock::now() - started;
    producer.join();

    ASSERT_TRUE(batch.is_ok());
    ASSERT_EQ(batch.value().size(), 1u);
    EXPECT_LT(waited, std::chrono::seconds{4});
}

TEST_F(UploadServerTest, ParallelChunksOfOneSession) {
    const auto data = make_bytes(20000, 5);
    const auto id = open(data);

    std::vector<std::thread> senders;
    for (std::uint32_t worker = 0; worker < 4; ++worker) {
        senders.emplace_back([&, worker]() {
            for (std::uint32_t i = worker; i < 20; i += 4) {
                EXPECT_TRUE(put(id, data, i).is_ok());
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    auto result = server_.finalize(id);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(read_file(*server_.artifact_path(result.value().artifact_id)), data);
}

TEST(ServerErrorTest, MapsToClientTaxonomy) {
    EXPECT_EQ(to_client_error({ServerErrorCode::NotFound, "x", {}}).code, ErrorCode::SessionExpired);
    EXPECT_EQ(to_client_error({ServerErrorCode::Gone, "x", {}}).code, ErrorCode::SessionExpired);
    EXPECT_EQ(to_client_error({ServerErrorCode::Internal, "x", {}}).code, ErrorCode::Transient);
    EXPECT_EQ(to_client_error({ServerErrorCode::AssemblyFailed, "x", {}}).code, ErrorCode::AssemblyFailed);
    EXPECT_EQ(to_client_error({ServerErrorCode::Conflict, "x", {}}).code, ErrorCode::Rejected);
    EXPECT_EQ(to_client_error({ServerErrorCode::BadRequest, "x", {}}).code, ErrorCode::Rejected);
}

TEST(ServerErrorTest, HttpStatusAndNames) {
    EXPECT_EQ(http_status_for(ServerErrorCode::Conflict), 409);
    EXPECT_EQ(http_status_for(ServerErrorCode::Gone), 410);
    EXPECT_EQ(http_status_for(ServerErrorCode::TooLarge), 413);
    EXPECT_EQ(server_error_code_from_string(to_string(ServerErrorCode::AssemblyFailed)),
              ServerErrorCode::AssemblyFailed);
    EXPECT_EQ(server_error_code_from_string("nonsense"), ServerErrorCode::Internal);
}
