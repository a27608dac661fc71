#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace chunkup {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocol
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // Avoids the DELETE macro some platform headers define
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes the upload endpoints produce
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,              // Finalize while incomplete, chunk while assembling
    GONE = 410,                  // Session expired or cancelled
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

namespace detail {

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    // Header names are case-insensitive (RFC 7230)
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

} // namespace detail

/**
 * @brief Represents an HTTP request
 *
 * Request-Line = Method SP Request-URI SP HTTP-Version CRLF
 * Headers = *(header-field CRLF)
 * CRLF
 * [ message-body ]
 *
 * The body is a byte vector because chunk uploads carry raw binary data.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                      // Request URI including any query string
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Get a header value (case-insensitive lookup)
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Serialize to wire format (used by the client)
     *
     * Sets Content-Length from the body; callers add Host and the rest.
     */
    std::vector<uint8_t> serialize() const;
};

/**
 * @brief Represents an HTTP response
 *
 * Status-Line = HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * Headers = *(header-field CRLF)
 * CRLF
 * [ message-body ]
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /**
     * @brief Set response body from a string, updating Content-Length
     */
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Serialize the response to bytes for transmission
     *
     * Format:
     * HTTP/1.1 200 OK\r\n
     * Content-Type: application/json\r\n
     * Content-Length: 13\r\n
     * \r\n
     * {"ok": true}
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;

        oss << detail::version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }

        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::GONE: return "Gone";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

inline std::vector<uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(method) << " " << url << " "
        << detail::version_to_string(version) << "\r\n";

    for (const auto& [name, value] : headers) {
        if (strcasecmp(name.c_str(), "Content-Length") != 0) {
            oss << name << ": " << value << "\r\n";
        }
    }
    oss << "Content-Length: " << body.size() << "\r\n\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace network
} // namespace chunkup
