#pragma once

#include "chunkup/network/http_parser.hpp"
#include "chunkup/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace chunkup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection owns one of these; shared_from_this keeps it
 * alive while reads and writes are pending. One request per connection,
 * the socket is shut down after the response is written.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 65536> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Handlers run on whichever threads call io_context.run(). The upload
 * server's event long-poll blocks its handler, so run the context from
 * several threads when push notifications are in use.
 *
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "0.0.0.0", 0);  // 0 = ephemeral port
 * server.set_handler([&](const HttpRequest& req) { return router.handle_request(req); });
 * spdlog::info("listening on {}", server.port());
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @throws boost::system::system_error if the address cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context, const std::string& address, uint16_t port,
                   size_t max_body_size = HttpParser::DEFAULT_MAX_BODY);

    void set_handler(HttpRequestHandler handler);

    /// Bound port, resolved when the constructor was given 0
    uint16_t port() const { return port_; }

    /**
     * @brief Stop accepting new connections
     *
     * Connections already accepted finish normally. Safe to call from any thread.
     */
    void stop();

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    size_t max_body_size_;
    uint16_t port_;
    std::atomic<bool> stopped_{false};
};

} // namespace network
} // namespace chunkup
