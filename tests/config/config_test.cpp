#include "chunkup/config/config.hpp"

#include "../test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace chunkup;
using namespace chunkup::config;
using chunkup::testing::TempDir;
using json = nlohmann::json;

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST(ClientConfigTest, EmptyObjectKeepsDefaults) {
    auto config = client_config_from_json(json::object());
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().server, "127.0.0.1:8080");
    EXPECT_EQ(config.value().request_timeout, std::chrono::milliseconds{30000});
    EXPECT_TRUE(config.value().push_notifications);
    EXPECT_EQ(config.value().upload.scheduler.worker_count, 4u);
}

TEST(ClientConfigTest, ReadsNestedUploadOptions) {
    json j = {
        {"server", "upload.internal:9000"},
        {"push_notifications", false},
        {"upload", {{"workers", 8}, {"max_attempts", 6}, {"chunk_size", 4096}}}
    };

    auto config = client_config_from_json(j);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().server, "upload.internal:9000");
    EXPECT_FALSE(config.value().push_notifications);
    EXPECT_EQ(config.value().upload.scheduler.worker_count, 8u);
    EXPECT_EQ(config.value().upload.retry.max_attempts, 6u);
    EXPECT_EQ(config.value().upload.chunk_size_hint, std::optional<std::uint64_t>(4096));
}

TEST(ClientConfigTest, RejectsInvalidValues) {
    auto wrong_type = client_config_from_json(json{{"server", 12}});
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().code, ErrorCode::ProtocolError);

    auto zero_timeout = client_config_from_json(json{{"request_timeout_ms", 0}});
    ASSERT_TRUE(zero_timeout.is_error());
    EXPECT_EQ(zero_timeout.error().code, ErrorCode::InvalidState);

    auto zero_workers = client_config_from_json(json{{"upload", {{"workers", 0}}}});
    ASSERT_TRUE(zero_workers.is_error());

    EXPECT_TRUE(client_config_from_json(json::array()).is_error());
}

TEST(ClientConfigTest, SerializedConfigReadsBack) {
    ClientConfig original;
    original.server = "10.0.0.2:8081";
    original.upload.max_passes = 5;

    auto parsed = client_config_from_json(client_config_to_json(original));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().server, "10.0.0.2:8081");
    EXPECT_EQ(parsed.value().upload.max_passes, 5u);
}

TEST(ServerConfigTest, StorageSectionOverridesDefaults) {
    json j = {
        {"port", 9090},
        {"threads", 2},
        {"storage", {{"chunk_size", 2048}, {"session_ttl_s", 120}, {"staging_root", "/tmp/stage"}}}
    };

    auto config = server_config_from_json(j);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().port, 9090);
    EXPECT_EQ(config.value().threads, 2u);
    EXPECT_EQ(config.value().storage.chunk_size, 2048u);
    EXPECT_EQ(config.value().storage.session_ttl, std::chrono::seconds{120});
    EXPECT_EQ(config.value().storage.staging_root.string(), "/tmp/stage");
    EXPECT_EQ(config.value().storage.artifact_root.string(), "upload_data/artifacts");
}

TEST(ServerConfigTest, RejectsInconsistentStorage) {
    auto zero_threads = server_config_from_json(json{{"threads", 0}});
    ASSERT_TRUE(zero_threads.is_error());
    EXPECT_EQ(zero_threads.error().code, ErrorCode::InvalidState);

    auto bounds = server_config_from_json(json{{"storage", {{"min_chunk_size", 10}, {"max_chunk_size", 5}}}});
    ASSERT_TRUE(bounds.is_error());

    auto zero_chunk = server_config_from_json(json{{"storage", {{"chunk_size", 0}}}});
    ASSERT_TRUE(zero_chunk.is_error());
}

TEST(ConfigFileTest, LoadsFromDisk) {
    TempDir dir;
    const auto path = dir / "server.json";
    write_text(path, R"({"address": "127.0.0.1", "log_level": "debug"})");

    auto config = load_server_config(path);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().address, "127.0.0.1");
    EXPECT_EQ(config.value().log_level, "debug");
}

TEST(ConfigFileTest, MissingFileIsIoError) {
    TempDir dir;
    auto config = load_client_config(dir / "absent.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::IoError);
}

TEST(ConfigFileTest, MalformedFileIsProtocolError) {
    TempDir dir;
    const auto path = dir / "client.json";
    write_text(path, "{ not json");

    auto config = load_client_config(path);
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::ProtocolError);
}
