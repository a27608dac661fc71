#include "chunkup/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace chunkup;
using namespace chunkup::network;

namespace {

Result<bool> feed(HttpParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestWithBody) {
    HttpParser parser;
    const std::string raw =
        "PUT /uploads/session-1/chunks/3 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/octet-stream\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    auto result = feed(parser, raw);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_TRUE(result.value());

    const auto& request = parser.get_request();
    EXPECT_EQ(request.method, HttpMethod::PUT);
    EXPECT_EQ(request.url, "/uploads/session-1/chunks/3");
    EXPECT_EQ(request.get_header("content-type"), "application/octet-stream");
    EXPECT_EQ(request.body_as_string(), "hello");
}

TEST(HttpParserTest, AcceptsDataInPieces) {
    HttpParser parser;
    const std::string raw =
        "POST /uploads HTTP/1.1\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "{\"a\":12345}";

    for (std::size_t i = 0; i + 1 < raw.size(); ++i) {
        auto partial = parser.parse(raw.data() + i, 1);
        ASSERT_TRUE(partial.is_ok());
        EXPECT_FALSE(partial.value());
    }
    auto last = parser.parse(raw.data() + raw.size() - 1, 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.take_request().body_as_string(), "{\"a\":12345}");
}

TEST(HttpParserTest, RequestWithoutContentLengthHasNoBody) {
    HttpParser parser;
    auto result = feed(parser, "GET /uploads/s/status HTTP/1.1\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(parser.is_complete());
    EXPECT_TRUE(parser.get_request().body.empty());
}

TEST(HttpParserTest, RejectsUnknownMethod) {
    HttpParser parser;
    auto result = feed(parser, "BREW /pot HTTP/1.1\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolError);
}

TEST(HttpParserTest, RejectsUnsupportedVersion) {
    HttpParser parser;
    auto result = feed(parser, "GET / HTTP/2.0\r\n\r\n");
    ASSERT_TRUE(result.is_error());
}

TEST(HttpParserTest, RejectsBadContentLength) {
    HttpParser parser;
    auto result = feed(parser, "POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(parser.body_too_large());
}

TEST(HttpParserTest, FlagsOversizedBody) {
    HttpParser parser(16);
    auto result = feed(parser, "PUT / HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(parser.body_too_large());
}

TEST(HttpParserTest, ResetAllowsNextRequest) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "DELETE /uploads/a HTTP/1.1\r\n\r\n").is_ok());
    ASSERT_TRUE(parser.is_complete());

    parser.reset();
    EXPECT_FALSE(parser.is_complete());
    ASSERT_TRUE(feed(parser, "GET /uploads/b/status HTTP/1.1\r\n\r\n").is_ok());
    EXPECT_EQ(parser.get_request().url, "/uploads/b/status");
}

TEST(HttpResponseParserTest, ParsesSerializedResponse) {
    HttpResponse original(HttpStatus::GONE);
    original.set_header("Content-Type", "application/json");
    original.set_body(std::string("{\"code\":\"gone\"}"));
    const auto wire = original.serialize();

    HttpResponseParser parser;
    // Split inside the header block
    const std::size_t split = 10;
    auto first = parser.parse(reinterpret_cast<const char*>(wire.data()), split);
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value());
    auto second = parser.parse(reinterpret_cast<const char*>(wire.data()) + split, wire.size() - split);
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value());

    auto response = parser.take_response();
    EXPECT_EQ(response.status_code, 410);
    EXPECT_EQ(response.reason_phrase, "Gone");
    EXPECT_EQ(response.get_header("content-type"), "application/json");
    EXPECT_EQ(response.body_as_string(), "{\"code\":\"gone\"}");
    EXPECT_FALSE(response.is_success());
}

TEST(HttpResponseParserTest, RejectsMalformedStatusLine) {
    HttpResponseParser parser;
    const std::string raw = "HTTP/1.1 OK\r\n\r\n";
    auto result = parser.parse(raw.data(), raw.size());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolError);
}

TEST(HttpMethodUtilsTest, RoundTripsNames) {
    EXPECT_EQ(HttpMethodUtils::from_string("GET"), HttpMethod::GET);
    EXPECT_EQ(HttpMethodUtils::from_string("DELETE"), HttpMethod::DELETE_METHOD);
    EXPECT_EQ(HttpMethodUtils::from_string("get"), HttpMethod::UNKNOWN);
    EXPECT_EQ(HttpMethodUtils::to_string(HttpMethod::PUT), "PUT");
}
