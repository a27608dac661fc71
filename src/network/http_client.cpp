#include "chunkup/network/http_client.hpp"

#include "chunkup/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <optional>

namespace chunkup {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Result<Endpoint> Endpoint::parse(const std::string& text, uint16_t default_port) {
    Endpoint endpoint;
    endpoint.port = default_port;

    auto colon = text.rfind(':');
    endpoint.host = colon == std::string::npos ? text : text.substr(0, colon);
    if (endpoint.host.empty()) {
        return Fail<Endpoint>(ErrorCode::InvalidState, "Missing host in endpoint '" + text + "'");
    }

    if (colon != std::string::npos) {
        std::string port = text.substr(colon + 1);
        size_t consumed = 0;
        unsigned long value = 0;
        try {
            value = std::stoul(port, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != port.size() || value == 0 || value > 65535) {
            return Fail<Endpoint>(ErrorCode::InvalidState, "Invalid port in endpoint '" + text + "'");
        }
        endpoint.port = static_cast<uint16_t>(value);
    }
    return Ok(std::move(endpoint));
}

namespace {

/**
 * @brief State of one request/response exchange
 *
 * resolve -> connect -> write -> read until the parser completes or EOF.
 * Kept alive by the shared_ptr captured in every handler.
 */
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    Exchange(asio::io_context& io, std::vector<uint8_t> wire)
        : resolver_(io), socket_(io), wire_(std::move(wire)) {}

    void start(const Endpoint& endpoint) {
        auto self = shared_from_this();
        resolver_.async_resolve(endpoint.host, std::to_string(endpoint.port),
            [this, self](boost::system::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail(ErrorCode::Transient, "Resolve failed: " + ec.message());
                    return;
                }
                asio::async_connect(socket_, results,
                    [this, self](boost::system::error_code ec, const tcp::endpoint&) {
                        if (ec) {
                            fail(ErrorCode::Transient, "Connect failed: " + ec.message());
                            return;
                        }
                        do_write();
                    });
            });
    }

    void abort() {
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.close(ignored);
    }

    bool finished() const { return done_; }

    Result<HttpResponse> take_result() {
        if (error_) {
            return Err<HttpResponse>(*error_);
        }
        return Ok(parser_.take_response());
    }

private:
    void do_write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(wire_),
            [this, self](boost::system::error_code ec, size_t) {
                if (ec) {
                    fail(ErrorCode::Transient, "Write failed: " + ec.message());
                    return;
                }
                do_read();
            });
    }

    void do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
            [this, self](boost::system::error_code ec, size_t bytes) {
                if (!ec) {
                    auto parsed = parser_.parse(buffer_.data(), bytes);
                    if (parsed.is_error()) {
                        fail(parsed.error().code, parsed.error().message);
                        return;
                    }
                    if (parsed.value()) {
                        finish();
                        return;
                    }
                    do_read();
                    return;
                }
                if (ec == asio::error::eof && parser_.is_complete()) {
                    finish();
                    return;
                }
                fail(ErrorCode::Transient, ec == asio::error::eof
                    ? std::string("Connection closed before the response completed")
                    : "Read failed: " + ec.message());
            });
    }

    void finish() {
        done_ = true;
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    void fail(ErrorCode code, std::string message) {
        if (!done_) {
            error_ = make_error(code, std::move(message));
            done_ = true;
        }
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    std::vector<uint8_t> wire_;
    std::array<char, 16384> buffer_{};
    HttpResponseParser parser_;
    std::optional<Error> error_;
    bool done_ = false;
};

} // namespace

Result<HttpResponse> HttpClient::send(HttpRequest request, std::chrono::milliseconds timeout) const {
    request.version = HttpVersion::HTTP_1_1;
    request.headers["Host"] = endpoint_.to_string();
    request.headers["Connection"] = "close";

    asio::io_context io;
    auto exchange = std::make_shared<Exchange>(io, request.serialize());
    exchange->start(endpoint_);

    io.run_for(timeout);
    if (!exchange->finished()) {
        exchange->abort();
        io.restart();
        io.poll();
        spdlog::debug("{} {} timed out after {}ms", HttpMethodUtils::to_string(request.method),
                      request.url, timeout.count());
        return Fail<HttpResponse>(ErrorCode::Transient,
            "Request to " + endpoint_.to_string() + request.url + " timed out");
    }
    return exchange->take_result();
}

Result<HttpResponse> HttpClient::get(const std::string& url, std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    return send(std::move(request), timeout);
}

Result<HttpResponse> HttpClient::post(const std::string& url, std::vector<uint8_t> body,
                                      const std::string& content_type,
                                      std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body = std::move(body);
    request.headers["Content-Type"] = content_type;
    return send(std::move(request), timeout);
}

Result<HttpResponse> HttpClient::delete_(const std::string& url, std::chrono::milliseconds timeout) const {
    HttpRequest request;
    request.method = HttpMethod::DELETE_METHOD;
    request.url = url;
    return send(std::move(request), timeout);
}

} // namespace network
} // namespace chunkup
