#include "chunkup/server/http_endpoints.hpp"

#include "chunkup/upload/wire_codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>

namespace chunkup::server {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(const ServerError& error) {
    json body = {{"error", error.message}, {"code", to_string(error.code)}};
    if (!error.missing_chunks.empty()) {
        body["missing_chunks"] = error.missing_chunks;
    }
    HttpResponse response(static_cast<HttpStatus>(http_status_for(error.code)));
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse bad_request(const std::string& message) {
    return make_error(ServerError{ServerErrorCode::BadRequest, message, {}});
}

/// Parse a non-negative decimal that fits in @p Int
template<typename Int>
std::optional<Int> parse_unsigned(const std::string& text) {
    if (text.empty() || text.size() > 20 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    unsigned long long value = std::stoull(text);
    if (value > std::numeric_limits<Int>::max()) {
        return std::nullopt;
    }
    return static_cast<Int>(value);
}

} // namespace

void register_upload_routes(network::HttpRouter& router, UploadServer& server) {
    router.get("/health", [](const HttpContext&) {
        return make_json_response(HttpStatus::OK, json{{"status", "ok"}});
    });

    router.get("/metrics", [&server](const HttpContext&) {
        auto metrics = server.metrics();
        return make_json_response(HttpStatus::OK, json{
            {"sessions", metrics.sessions_by_state},
            {"chunks_accepted", metrics.chunks_accepted},
            {"duplicate_chunks", metrics.duplicate_chunks},
            {"bytes_received", metrics.bytes_received},
            {"artifacts_assembled", metrics.artifacts_assembled}
        });
    });

    router.post("/uploads/initialize", [&server](const HttpContext& ctx) {
        auto body = json::parse(ctx.request.body_as_string(), nullptr, false);
        if (body.is_discarded()) {
            return bad_request("Invalid JSON");
        }
        auto request = upload::initialize_request_from_json(body);
        if (request.is_error()) {
            return bad_request(request.error().message);
        }

        auto result = server.initialize(request.value());
        if (result.is_error()) {
            return make_error(result.error());
        }
        return make_json_response(HttpStatus::CREATED, upload::initialize_response_to_json(result.value()));
    });

    router.post("/uploads/:id/chunks/:index", [&server](const HttpContext& ctx) {
        auto index = parse_unsigned<std::uint32_t>(ctx.get_param("index"));
        if (!index) {
            return bad_request("Invalid chunk index: " + ctx.get_param("index"));
        }

        auto result = server.accept_chunk(ctx.get_param("id"), *index, ctx.request.body);
        if (result.is_error()) {
            return make_error(result.error());
        }
        return make_json_response(HttpStatus::OK, upload::put_chunk_response_to_json(result.value()));
    });

    router.get("/uploads/:id/status", [&server](const HttpContext& ctx) {
        auto result = server.status(ctx.get_param("id"));
        if (result.is_error()) {
            return make_error(result.error());
        }
        return make_json_response(HttpStatus::OK, upload::remote_status_to_json(result.value()));
    });

    router.post("/uploads/:id/finalize", [&server](const HttpContext& ctx) {
        auto result = server.finalize(ctx.get_param("id"));
        if (result.is_error()) {
            return make_error(result.error());
        }
        return make_json_response(HttpStatus::OK, upload::finalize_result_to_json(result.value()));
    });

    router.delete_("/uploads/:id", [&server](const HttpContext& ctx) {
        auto result = server.cancel(ctx.get_param("id"));
        if (result.is_error()) {
            return make_error(result.error());
        }
        return make_json_response(HttpStatus::OK, json{{"session_id", ctx.get_param("id")}, {"status", "cancelled"}});
    });

    router.get("/uploads/:id/events", [&server](const HttpContext& ctx) {
        auto after = parse_unsigned<std::uint64_t>(ctx.get_query("after", "0"));
        auto wait_ms = parse_unsigned<std::uint64_t>(ctx.get_query("wait_ms", "0"));
        if (!after || !wait_ms) {
            return bad_request("after and wait_ms must be non-negative integers");
        }
        auto wait = std::chrono::milliseconds(
            std::min<std::uint64_t>(*wait_ms, static_cast<std::uint64_t>(MAX_EVENT_WAIT.count())));

        auto result = server.events_after(ctx.get_param("id"), *after, wait);
        if (result.is_error()) {
            return make_error(result.error());
        }

        json events = json::array();
        for (const auto& event : result.value()) {
            events.push_back(notify::progress_event_to_json(event));
        }
        return make_json_response(HttpStatus::OK, json{{"events", events}});
    });

    spdlog::debug("Registered {} upload routes", router.route_count());
}

} // namespace chunkup::server
