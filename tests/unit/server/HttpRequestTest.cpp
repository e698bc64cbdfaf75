/**
 * @file HttpRequestTest.cpp
 * @brief Unit tests for request-line parsing and query handling
 */

#include "server/HttpRequest.hpp"

#include <gtest/gtest.h>

using namespace server;
using namespace std::chrono_literals;

// ========== parse_request_head Tests ==========

TEST(HttpRequestTest, ParseRequestHead_SplitsMethodPathAndQuery) {
    auto request =
        parse_request_head("GET /api/drives/stream?interval=5&x=1 HTTP/1.1\r\nHost: a\r\n\r\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "GET");
    EXPECT_EQ(request->path, "/api/drives/stream");
    EXPECT_EQ(request->query_value("interval"), "5");
    EXPECT_EQ(request->query_value("x"), "1");
    EXPECT_FALSE(request->query_value("missing").has_value());
}

TEST(HttpRequestTest, ParseRequestHead_BareLineFeed) {
    auto request = parse_request_head("POST /api/drives/refresh HTTP/1.0\n\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->path, "/api/drives/refresh");
}

TEST(HttpRequestTest, ParseRequestHead_StripsFragmentAndDecodesPath) {
    auto request = parse_request_head("GET /api/dri%76es#top HTTP/1.1\r\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->path, "/api/drives");
    EXPECT_TRUE(request->query.empty());
}

TEST(HttpRequestTest, ParseRequestHead_AsteriskTarget) {
    auto request = parse_request_head("OPTIONS * HTTP/1.1\r\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->path, "*");
}

TEST(HttpRequestTest, ParseRequestHead_MalformedLines_AreRejected) {
    EXPECT_FALSE(parse_request_head("").has_value());
    EXPECT_FALSE(parse_request_head("GET\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET /\r\n").has_value());
    EXPECT_FALSE(parse_request_head("get / HTTP/1.1\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/2\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET api/drives HTTP/1.1\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET http://host/ HTTP/1.1\r\n").has_value());
}

// ========== Query Tests ==========

TEST(HttpRequestTest, ParseQueryString_LastOccurrenceWins) {
    auto params = parse_query_string("interval=5&interval=7");

    EXPECT_EQ(params.at("interval"), "7");
}

TEST(HttpRequestTest, ParseQueryString_EmptyPairsAndBareKeys) {
    auto params = parse_query_string("&&flag&a=&b=2");

    EXPECT_EQ(params.size(), 3u);
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_EQ(params.at("a"), "");
    EXPECT_EQ(params.at("b"), "2");
}

TEST(HttpRequestTest, PercentDecode_PlusAndEscapes) {
    EXPECT_EQ(percent_decode("a+b%20c%2Fd"), "a b c/d");
    EXPECT_EQ(percent_decode("100%"), "100%");
    EXPECT_EQ(percent_decode("%zz%4"), "%zz%4");
}

// ========== parse_stream_interval Tests ==========

TEST(HttpRequestTest, ParseStreamInterval_AbsentOrInvalid_UsesDefault) {
    EXPECT_EQ(parse_stream_interval(std::nullopt), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("abc"), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval(""), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("5s"), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("0"), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("-3"), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("nan"), DEFAULT_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("inf"), DEFAULT_STREAM_INTERVAL);
}

TEST(HttpRequestTest, ParseStreamInterval_SecondsToMilliseconds) {
    EXPECT_EQ(parse_stream_interval("5"), 5000ms);
    EXPECT_EQ(parse_stream_interval("2.5"), 2500ms);
    EXPECT_EQ(parse_stream_interval("1.0009"), 1000ms);
}

TEST(HttpRequestTest, ParseStreamInterval_ClampedToBounds) {
    EXPECT_EQ(parse_stream_interval("0.2"), MIN_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("1e9"), MAX_STREAM_INTERVAL);
    EXPECT_EQ(parse_stream_interval("86400"), MAX_STREAM_INTERVAL);
}
