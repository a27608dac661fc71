#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup {
namespace network {

struct Endpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;

    /**
     * @brief Parse "host:port" (a bare host keeps @p default_port)
     * @return InvalidState for an empty host or a bad port
     */
    static Result<Endpoint> parse(const std::string& text, uint16_t default_port = 8080);

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Blocking HTTP/1.1 client built on Boost.Asio
 *
 * Each call opens one connection, sends the request and reads the whole
 * response (the server closes after every response). The async chain runs
 * on a private io_context for at most @p timeout, so a stalled server
 * shows up as a Transient error instead of a hang.
 *
 * Errors: Transient for resolve, connect, I/O and timeout failures;
 * ProtocolError for a response that cannot be parsed. HTTP error statuses
 * are returned as responses, not errors. Thread-safe: calls share nothing.
 */
class HttpClient {
public:
    explicit HttpClient(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

    Result<HttpResponse> send(HttpRequest request, std::chrono::milliseconds timeout) const;

    Result<HttpResponse> get(const std::string& url, std::chrono::milliseconds timeout) const;

    Result<HttpResponse> post(const std::string& url, std::vector<uint8_t> body,
                              const std::string& content_type,
                              std::chrono::milliseconds timeout) const;

    Result<HttpResponse> delete_(const std::string& url, std::chrono::milliseconds timeout) const;

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Endpoint endpoint_;
};

} // namespace network
} // namespace chunkup
