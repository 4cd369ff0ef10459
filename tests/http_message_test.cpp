// http_message_test.cpp - Tests for the Yakumo HTTP message parsing
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>
#include <yakumo/server/net/http/http_message.hpp>

using namespace Yakumo::Net::HTTP;

// Test parsing of a typical API request
TEST(HttpMessageTest, ParsesRequestHead) {
    auto req = parseRequestHead(
        "GET /open_proxy?target_ip=10.0.0.5&target_port=51820 HTTP/1.1\r\n"
        "Host: localhost:3000\r\n"
        "Authorization:   Bearer s3cret  \r\n"
        "\r\n");

    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->method, "GET");
    EXPECT_EQ(req->path, "/open_proxy");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->param("target_ip"), "10.0.0.5");
    EXPECT_EQ(req->param("target_port"), "51820");
    EXPECT_FALSE(req->param("session_id").has_value());
    EXPECT_EQ(req->header("authorization"), "Bearer s3cret");
    EXPECT_EQ(req->header("AUTHORIZATION"), "Bearer s3cret");
}

// Test query decoding rules
TEST(HttpMessageTest, QueryDecoding) {
    auto req = parseRequestHead("GET /x?a=1%3A2&b=hello+world&a=ignored&flag HTTP/1.1\r\n\r\n");

    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->param("a"), "1:2");
    EXPECT_EQ(req->param("b"), "hello world");
    EXPECT_EQ(req->param("flag"), "");
}

// Test that malformed heads are refused
TEST(HttpMessageTest, RejectsMalformed) {
    EXPECT_FALSE(parseRequestHead("").has_value());
    EXPECT_FALSE(parseRequestHead("GET /\r\n\r\n").has_value());
    EXPECT_FALSE(parseRequestHead("GET / HTTP/1.1 extra\r\n\r\n").has_value());
    EXPECT_FALSE(parseRequestHead("GET / FTP/1.0\r\n\r\n").has_value());
    EXPECT_FALSE(parseRequestHead("GET health HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(parseRequestHead("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n").has_value());
}

// Test percent decoding edge cases
TEST(HttpMessageTest, UrlDecode) {
    EXPECT_EQ(urlDecode("a%20b", false), "a b");
    EXPECT_EQ(urlDecode("a+b", false), "a+b");
    EXPECT_EQ(urlDecode("a+b", true), "a b");
    EXPECT_EQ(urlDecode("100%", true), "100%");
    EXPECT_EQ(urlDecode("%zz", true), "%zz");
    EXPECT_EQ(urlDecode("%3a%3A", true), "::");
}

// Test response serialization
TEST(HttpMessageTest, SerializesResponse) {
    HttpResponse res;
    res.status = 404;
    res.body = "{\"detail\":\"Not Found\"}";

    EXPECT_EQ(res.serialize(),
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 22\r\n"
        "Connection: close\r\n"
        "\r\n"
        "{\"detail\":\"Not Found\"}");
    EXPECT_STREQ(HttpResponse::reasonPhrase(503), "Service Unavailable");
}
