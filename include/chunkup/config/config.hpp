#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/server/upload_server.hpp"
#include "chunkup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkup::config {

/**
 * @brief Settings of the chunkup_client binary
 *
 * JSON layout (every key optional):
 * {
 *   "server": "127.0.0.1:8080",
 *   "journal_dir": ".chunkup",
 *   "log_level": "info",
 *   "request_timeout_ms": 30000,
 *   "push_notifications": true,
 *   "upload": { "workers": 4, "max_attempts": 3, ... }
 * }
 */
struct ClientConfig {
    std::string server = "127.0.0.1:8080";
    std::filesystem::path journal_dir = ".chunkup";
    std::string log_level = "info";
    std::chrono::milliseconds request_timeout{30000};
    bool push_notifications = true;
    upload::UploadOptions upload;
};

/**
 * @brief Settings of the chunkup_server binary
 *
 * {
 *   "address": "0.0.0.0", "port": 8080, "threads": 4,
 *   "log_level": "info", "sweep_interval_s": 60,
 *   "storage": { "staging_root": ..., "artifact_root": ..., "chunk_size": ...,
 *                "max_file_size": ..., "session_ttl_s": ... }
 * }
 */
struct ServerConfig {
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 4;
    std::string log_level = "info";
    std::chrono::seconds sweep_interval{60};
    server::ServerOptions storage;
};

Result<ClientConfig> client_config_from_json(const nlohmann::json& j, ClientConfig defaults = {});
Result<ServerConfig> server_config_from_json(const nlohmann::json& j, ServerConfig defaults = {});

nlohmann::json client_config_to_json(const ClientConfig& config);
nlohmann::json server_config_to_json(const ServerConfig& config);

/**
 * @brief Read a JSON config file
 * @return IoError if unreadable, ProtocolError if not JSON, InvalidState for bad values
 */
Result<ClientConfig> load_client_config(const std::filesystem::path& path);
Result<ServerConfig> load_server_config(const std::filesystem::path& path);

} // namespace chunkup::config
