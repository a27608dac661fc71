#include "chunkup/events/events.hpp"
#include "chunkup/network/http_router.hpp"
#include "chunkup/network/http_server_asio.hpp"
#include "chunkup/network/http_upload_api.hpp"
#include "chunkup/server/http_endpoints.hpp"
#include "chunkup/server/upload_server.hpp"
#include "chunkup/upload/coordinator.hpp"

#include "../local_server.hpp"
#include "../test_support.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace chunkup;
using namespace chunkup::network;
using chunkup::testing::TempDir;
using chunkup::testing::make_bytes;
using chunkup::testing::read_file;
using chunkup::testing::server_options_in;
using chunkup::testing::write_file;

namespace {

constexpr auto kTimeout = std::chrono::milliseconds{5000};

/// Upload server behind the real router and Asio listener on an ephemeral port
class HttpUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.emplace(server_options_in(dir_, 1000), server_bus_);
        server::register_upload_routes(router_, *server_);

        http_.emplace(io_context_, "127.0.0.1", 0);
        http_->set_handler([this](const HttpRequest& request) { return router_.handle_request(request); });

        work_.emplace(boost::asio::make_work_guard(io_context_));
        // The events long-poll holds a handler thread
        for (int i = 0; i < 4; ++i) {
            threads_.emplace_back([this]() { io_context_.run(); });
        }
    }

    void TearDown() override {
        http_->stop();
        work_.reset();
        io_context_.stop();
        for (auto& thread : threads_) {
            thread.join();
        }
    }

    Endpoint endpoint() const { return Endpoint{"127.0.0.1", http_->port()}; }

    std::string open_session(std::uint64_t size) {
        upload::InitializeRequest request;
        request.file.name = "wire.bin";
        request.file.total_size_bytes = size;
        auto init = api().initialize(request);
        EXPECT_TRUE(init.is_ok()) << (init.is_ok() ? "" : init.error().message);
        return init.is_ok() ? init.value().session_id : std::string{};
    }

    HttpUploadApi& api() {
        if (!api_) {
            api_.emplace(endpoint(), kTimeout);
        }
        return *api_;
    }

    TempDir dir_{"chunkup_http"};
    events::EventBus server_bus_;
    std::optional<server::UploadServer> server_;
    HttpRouter router_;
    boost::asio::io_context io_context_;
    std::optional<HttpServerAsio> http_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::optional<HttpUploadApi> api_;
};

} // namespace

TEST(EndpointTest, ParsesHostAndPort) {
    auto full = Endpoint::parse("example.org:9000");
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(full.value().host, "example.org");
    EXPECT_EQ(full.value().port, 9000);

    auto bare = Endpoint::parse("localhost", 7070);
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(bare.value().port, 7070);
    EXPECT_EQ(bare.value().to_string(), "localhost:7070");

    EXPECT_TRUE(Endpoint::parse(":80").is_error());
    EXPECT_TRUE(Endpoint::parse("host:http").is_error());
    EXPECT_TRUE(Endpoint::parse("host:70000").is_error());
}

TEST_F(HttpUploadTest, ListenerResolvesEphemeralPort) {
    EXPECT_NE(http_->port(), 0);
}

TEST_F(HttpUploadTest, ChunkAndStatusRoundTrip) {
    const auto id = open_session(2500);

    auto first = api().put_chunk(id, 1, make_bytes(1000, 1), kTimeout);
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    EXPECT_EQ(first.value().status, upload::ChunkAckStatus::Accepted);

    auto again = api().put_chunk(id, 1, make_bytes(1000, 1), kTimeout);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().status, upload::ChunkAckStatus::AlreadyAccepted);

    auto status = api().status(id);
    ASSERT_TRUE(status.is_ok()) << status.error().message;
    EXPECT_EQ(status.value().total_chunks, 3u);
    ASSERT_TRUE(status.value().uploaded_chunks && status.value().missing_chunks);
    EXPECT_EQ(*status.value().uploaded_chunks, std::vector<std::uint32_t>({1}));
    EXPECT_EQ(*status.value().missing_chunks, std::vector<std::uint32_t>({0, 2}));
}

TEST_F(HttpUploadTest, ServerErrorsMapToClientTaxonomy) {
    auto unknown = api().status("session-404");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code, ErrorCode::SessionExpired);

    const auto id = open_session(2000);
    auto incomplete = api().finalize(id);
    ASSERT_TRUE(incomplete.is_error());
    EXPECT_EQ(incomplete.error().code, ErrorCode::Rejected);

    auto short_chunk = api().put_chunk(id, 0, make_bytes(10), kTimeout);
    ASSERT_TRUE(short_chunk.is_error());
    EXPECT_EQ(short_chunk.error().code, ErrorCode::Rejected);

    ASSERT_TRUE(api().cancel(id).is_ok());
    auto after_cancel = api().put_chunk(id, 0, make_bytes(1000), kTimeout);
    ASSERT_TRUE(after_cancel.is_error());
    EXPECT_EQ(after_cancel.error().code, ErrorCode::SessionExpired);
}

TEST_F(HttpUploadTest, RouterAnswersUnknownPaths) {
    HttpClient client(endpoint());
    auto missing = client.get("/nothing/here", kTimeout);
    ASSERT_TRUE(missing.is_ok()) << missing.error().message;
    EXPECT_EQ(missing.value().status_code, 404);
}

TEST_F(HttpUploadTest, UnreachableServerIsTransient) {
    HttpUploadApi offline(Endpoint{"127.0.0.1", 1}, std::chrono::milliseconds{500});
    auto status = offline.status("session-1");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().code, ErrorCode::Transient);
}

TEST_F(HttpUploadTest, CoordinatorUploadsOverHttpWithPushChannel) {
    TempDir files;
    const auto data = make_bytes(9500, 11);
    const auto path = files / "payload.bin";
    write_file(path, data);

    upload::SessionStore store;
    events::EventBus bus;
    std::atomic<int> acks{0};
    std::atomic<int> assembled{0};
    bus.subscribe<events::ChunkAckNotifiedEvent>([&](const events::ChunkAckNotifiedEvent&) { acks++; });
    bus.subscribe<events::AssemblyCompletedEvent>([&](const events::AssemblyCompletedEvent&) { assembled++; });

    upload::SessionCoordinator coordinator(api(), store, bus);
    coordinator.set_channel_connector(http_channel_connector(endpoint()));

    upload::UploadOptions options;
    options.scheduler.worker_count = 3;
    options.retry.initial_backoff = std::chrono::milliseconds{1};
    auto session = coordinator.initialize_file(path, options);
    ASSERT_TRUE(session.is_ok()) << session.error().message;

    auto result = coordinator.upload(session.value()->session_id());
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    auto artifact = server_->artifact_path(result.value().artifact_id);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(read_file(*artifact), data);
    EXPECT_EQ(acks.load(), 10);
    EXPECT_EQ(assembled.load(), 1);
}

TEST_F(HttpUploadTest, PollingChannelWaitsForEvents) {
    const auto id = open_session(2000);
    HttpPollingChannel channel(endpoint(), id);

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        EXPECT_TRUE(server_->accept_chunk(id, 0, make_bytes(1000)).is_ok());
    });
    auto batch = channel.receive(std::chrono::milliseconds{3000});
    producer.join();

    ASSERT_TRUE(batch.is_ok()) << batch.error().message;
    ASSERT_EQ(batch.value().size(), 1u);
    EXPECT_EQ(batch.value()[0].type, notify::ProgressEventType::ChunkAcked);
    EXPECT_EQ(batch.value()[0].sequence, 1u);

    channel.close();
    EXPECT_TRUE(channel.receive(std::chrono::milliseconds{0}).is_error());
}
