#include "chunkup/config/config.hpp"

#include "chunkup/upload/json_codec.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace chunkup::config {

using json = nlohmann::json;

namespace {

Result<json> read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Fail<json>(ErrorCode::IoError, "Cannot open config file: " + path.string());
    }
    auto j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return Fail<json>(ErrorCode::ProtocolError, "Config file is not valid JSON: " + path.string());
    }
    return Ok(std::move(j));
}

} // namespace

// ═══════════════════════════════════════════════════════════════
// Client
// ═══════════════════════════════════════════════════════════════

Result<ClientConfig> client_config_from_json(const json& j, ClientConfig defaults) {
    if (!j.is_object()) {
        return Fail<ClientConfig>(ErrorCode::ProtocolError, "Client config must be a JSON object");
    }

    ClientConfig config = std::move(defaults);
    try {
        config.server = j.value("server", config.server);
        config.journal_dir = j.value("journal_dir", config.journal_dir.string());
        config.log_level = j.value("log_level", config.log_level);
        config.request_timeout = std::chrono::milliseconds(
            j.value("request_timeout_ms", config.request_timeout.count()));
        config.push_notifications = j.value("push_notifications", config.push_notifications);
    } catch (const json::exception& e) {
        return Fail<ClientConfig>(ErrorCode::ProtocolError, std::string("Bad client config: ") + e.what());
    }

    if (j.contains("upload")) {
        auto upload = upload::options_from_json(j["upload"], config.upload);
        if (upload.is_error()) {
            return Err<ClientConfig>(upload.error());
        }
        config.upload = std::move(upload.value());
    }

    if (config.request_timeout.count() <= 0) {
        return Fail<ClientConfig>(ErrorCode::InvalidState, "request_timeout_ms must be positive");
    }
    return Ok(std::move(config));
}

json client_config_to_json(const ClientConfig& config) {
    return {
        {"server", config.server},
        {"journal_dir", config.journal_dir.string()},
        {"log_level", config.log_level},
        {"request_timeout_ms", config.request_timeout.count()},
        {"push_notifications", config.push_notifications},
        {"upload", upload::options_to_json(config.upload)}
    };
}

Result<ClientConfig> load_client_config(const std::filesystem::path& path) {
    auto j = read_json_file(path);
    if (j.is_error()) {
        return Err<ClientConfig>(j.error());
    }
    spdlog::debug("Loaded client config from {}", path.string());
    return client_config_from_json(j.value());
}

// ═══════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════

Result<ServerConfig> server_config_from_json(const json& j, ServerConfig defaults) {
    if (!j.is_object()) {
        return Fail<ServerConfig>(ErrorCode::ProtocolError, "Server config must be a JSON object");
    }

    ServerConfig config = std::move(defaults);
    try {
        config.address = j.value("address", config.address);
        config.port = j.value("port", config.port);
        config.threads = j.value("threads", config.threads);
        config.log_level = j.value("log_level", config.log_level);
        config.sweep_interval = std::chrono::seconds(
            j.value("sweep_interval_s", config.sweep_interval.count()));

        if (j.contains("storage")) {
            const auto& storage = j["storage"];
            auto& opts = config.storage;
            opts.staging_root = storage.value("staging_root", opts.staging_root.string());
            opts.artifact_root = storage.value("artifact_root", opts.artifact_root.string());
            opts.chunk_size = storage.value("chunk_size", opts.chunk_size);
            opts.max_file_size = storage.value("max_file_size", opts.max_file_size);
            opts.session_ttl = std::chrono::seconds(storage.value("session_ttl_s", opts.session_ttl.count()));
            opts.accept_chunk_size_hint = storage.value("accept_chunk_size_hint", opts.accept_chunk_size_hint);
            opts.min_chunk_size = storage.value("min_chunk_size", opts.min_chunk_size);
            opts.max_chunk_size = storage.value("max_chunk_size", opts.max_chunk_size);
        }
    } catch (const json::exception& e) {
        return Fail<ServerConfig>(ErrorCode::ProtocolError, std::string("Bad server config: ") + e.what());
    }

    if (config.threads == 0) {
        return Fail<ServerConfig>(ErrorCode::InvalidState, "threads must be at least 1");
    }
    if (config.storage.chunk_size == 0) {
        return Fail<ServerConfig>(ErrorCode::InvalidState, "storage.chunk_size must be positive");
    }
    if (config.storage.min_chunk_size == 0 || config.storage.min_chunk_size > config.storage.max_chunk_size) {
        return Fail<ServerConfig>(ErrorCode::InvalidState, "storage chunk size bounds are inconsistent");
    }
    if (config.sweep_interval.count() <= 0) {
        return Fail<ServerConfig>(ErrorCode::InvalidState, "sweep_interval_s must be positive");
    }
    return Ok(std::move(config));
}

json server_config_to_json(const ServerConfig& config) {
    const auto& opts = config.storage;
    return {
        {"address", config.address},
        {"port", config.port},
        {"threads", config.threads},
        {"log_level", config.log_level},
        {"sweep_interval_s", config.sweep_interval.count()},
        {"storage", {
            {"staging_root", opts.staging_root.string()},
            {"artifact_root", opts.artifact_root.string()},
            {"chunk_size", opts.chunk_size},
            {"max_file_size", opts.max_file_size},
            {"session_ttl_s", opts.session_ttl.count()},
            {"accept_chunk_size_hint", opts.accept_chunk_size_hint},
            {"min_chunk_size", opts.min_chunk_size},
            {"max_chunk_size", opts.max_chunk_size}
        }}
    };
}

Result<ServerConfig> load_server_config(const std::filesystem::path& path) {
    auto j = read_json_file(path);
    if (j.is_error()) {
        return Err<ServerConfig>(j.error());
    }
    spdlog::debug("Loaded server config from {}", path.string());
    return server_config_from_json(j.value());
}

} // namespace chunkup::config
