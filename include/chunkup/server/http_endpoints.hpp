#pragma once

#include "chunkup/network/http_router.hpp"
#include "chunkup/server/upload_server.hpp"

#include <chrono>

namespace chunkup::server {

/// Longest long-poll a client may request on the events endpoint
inline constexpr std::chrono::milliseconds MAX_EVENT_WAIT{30000};

/**
 * @brief Mount the upload protocol on @p router
 *
 *   POST   /uploads/initialize             JSON InitializeRequest
 *   POST   /uploads/:id/chunks/:index      raw chunk bytes
 *   GET    /uploads/:id/status
 *   POST   /uploads/:id/finalize
 *   DELETE /uploads/:id
 *   GET    /uploads/:id/events?after=N&wait_ms=M
 *   GET    /health, GET /metrics
 *
 * Failures answer {"error": message, "code": name} with the status from
 * http_status_for(); a finalize conflict adds "missing_chunks".
 * @p server must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router, UploadServer& server);

} // namespace chunkup::server
