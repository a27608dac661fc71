#pragma once

#include "http_types.hpp"
#include "chunkup/core/result.hpp"

#include <cctype>
#include <cstddef>
#include <string>

namespace chunkup {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Optional body, Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP request parser
 *
 * Data can be fed as it arrives from the socket:
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(buffer, bytes_read);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 *
 * The request line and headers are consumed one character at a time;
 * once the body starts it is copied in bulk because chunk payloads are
 * megabytes long.
 */
class HttpParser {
public:
    /// Largest body accepted before the parser reports an error
    static constexpr size_t DEFAULT_MAX_BODY = 128 * 1024 * 1024;

    explicit HttpParser(size_t max_body_size = DEFAULT_MAX_BODY)
        : max_body_size_(max_body_size) {
        reset();
    }

    /**
     * @brief Parse incoming data
     * @return true once a complete request is available, false if more
     *         data is needed; ProtocolError for a malformed request
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Fail<bool>(ErrorCode::ProtocolError, "Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                i += parse_body(data + i, len - i);
                continue;
            }

            char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            const char* what = "";
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    what = "HTTP method";
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    what = "URL";
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    what = "HTTP version";
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c);
                    what = "header name";
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c);
                    what = "header value";
                    break;
                default:
                    break;
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                std::string message = error_.empty()
                    ? std::string("Failed to parse ") + what + " at line " + std::to_string(line_)
                    : error_;
                return Fail<bool>(ErrorCode::ProtocolError, message);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    const HttpRequest& get_request() const { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    /// True when the last failure was a body over the size limit
    bool body_too_large() const { return body_too_large_; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        content_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    size_t max_body_size_;
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t content_length_;
    size_t line_;
    bool last_char_was_cr_;
    bool body_too_large_;

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line: headers complete
            last_char_was_cr_ = false;
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        size_t consumed = 0;
        unsigned long long length = 0;
        try {
            length = std::stoull(content_length, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != content_length.size()) {
            error_ = "Invalid Content-Length: " + content_length;
            return false;
        }
        if (length > max_body_size_) {
            body_too_large_ = true;
            error_ = "Request body of " + content_length + " bytes exceeds limit";
            return false;
        }

        content_length_ = static_cast<size_t>(length);
        if (content_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(content_length_);
        state_ = ParseState::BODY;
        return true;
    }

    size_t parse_body(const char* data, size_t len) {
        size_t wanted = content_length_ - request_.body.size();
        size_t take = len < wanted ? len : wanted;
        request_.body.insert(request_.body.end(),
                             reinterpret_cast<const uint8_t*>(data),
                             reinterpret_cast<const uint8_t*>(data) + take);
        if (request_.body.size() >= content_length_) {
            state_ = ParseState::COMPLETE;
        }
        return take;
    }
};

/**
 * @brief Parser for HTTP responses read by the client
 *
 * Buffers until the blank line, then reads Content-Length body bytes.
 * Responses without Content-Length are treated as having no body.
 */
class HttpResponseParser {
public:
    Result<bool> parse(const char* data, size_t len) {
        if (complete_) {
            return Ok(true);
        }

        if (!headers_done_) {
            head_.append(data, len);
            auto end = head_.find("\r\n\r\n");
            if (end == std::string::npos) {
                return Ok(false);
            }
            std::string rest = head_.substr(end + 4);
            head_.resize(end);
            auto parsed = parse_head();
            if (parsed.is_error()) {
                return Err<bool>(parsed.error());
            }
            headers_done_ = true;
            append_body(rest.data(), rest.size());
        } else {
            append_body(data, len);
        }
        return Ok(complete_);
    }

    bool is_complete() const { return complete_; }

    HttpResponse take_response() { return std::move(response_); }

private:
    Result<void> parse_head() {
        auto line_end = head_.find("\r\n");
        std::string status_line = head_.substr(0, line_end);

        // HTTP/1.1 200 OK
        auto first_space = status_line.find(' ');
        if (first_space == std::string::npos) {
            return Err<void>(make_error(ErrorCode::ProtocolError,
                                        "Malformed status line: " + status_line));
        }
        std::string version = status_line.substr(0, first_space);
        if (version == "HTTP/1.1") {
            response_.version = HttpVersion::HTTP_1_1;
        } else if (version == "HTTP/1.0") {
            response_.version = HttpVersion::HTTP_1_0;
        } else {
            return Err<void>(make_error(ErrorCode::ProtocolError,
                                        "Unsupported HTTP version: " + version));
        }

        auto second_space = status_line.find(' ', first_space + 1);
        std::string code = status_line.substr(first_space + 1,
            second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);
        if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
            !std::isdigit(static_cast<unsigned char>(code[1])) ||
            !std::isdigit(static_cast<unsigned char>(code[2]))) {
            return Err<void>(make_error(ErrorCode::ProtocolError, "Malformed status code: " + code));
        }
        response_.status_code = std::stoi(code);
        if (second_space != std::string::npos) {
            response_.reason_phrase = status_line.substr(second_space + 1);
        }

        size_t pos = line_end == std::string::npos ? head_.size() : line_end + 2;
        while (pos < head_.size()) {
            auto next = head_.find("\r\n", pos);
            std::string line = head_.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
            pos = next == std::string::npos ? head_.size() : next + 2;

            auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                return Err<void>(make_error(ErrorCode::ProtocolError, "Malformed header: " + line));
            }
            std::string value = line.substr(colon + 1);
            auto start = value.find_first_not_of(' ');
            value = start == std::string::npos ? std::string() : value.substr(start);
            response_.headers[line.substr(0, colon)] = value;
        }

        std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            size_t consumed = 0;
            try {
                content_length_ = std::stoull(content_length, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed != content_length.size()) {
                return Err<void>(make_error(ErrorCode::ProtocolError,
                                            "Invalid Content-Length: " + content_length));
            }
        }
        return Ok();
    }

    void append_body(const char* data, size_t len) {
        size_t wanted = content_length_ - response_.body.size();
        size_t take = len < wanted ? len : wanted;
        response_.body.insert(response_.body.end(),
                              reinterpret_cast<const uint8_t*>(data),
                              reinterpret_cast<const uint8_t*>(data) + take);
        complete_ = response_.body.size() >= content_length_;
    }

    HttpResponse response_;
    std::string head_;
    size_t content_length_ = 0;
    bool headers_done_ = false;
    bool complete_ = false;
};

} // namespace network
} // namespace chunkup
