//------------------------------------------------------------------------------
/*
    This file is part of gas-sentinel
    Copyright (c) 2025, the gas-sentinel developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "chain/impl/HttpTransport.hpp"
#include "chain/impl/Url.hpp"
#include "util/AsioContextTestFixture.hpp"
#include "util/TestHttpServer.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

using namespace chain::impl;
namespace http = boost::beast::http;
using testing::HasSubstr;

namespace {

constexpr auto kTIMEOUT = std::chrono::seconds{5};

}  // namespace

struct HttpTransportTests : AsyncAsioContextTest {
    TestHttpServer server{ctx_, "127.0.0.1"};

    [[nodiscard]] Url
    serverUrl(std::string const& target = "/rpc") const
    {
        return Url{.secure = false, .host = "127.0.0.1", .port = server.port(), .target = target};
    }
};

TEST_F(HttpTransportTests, PostsJson)
{
    server.handleRequest([this](http::request<http::string_body> request) -> std::optional<http::response<http::string_body>> {
        EXPECT_EQ(request.method(), http::verb::post);
        EXPECT_EQ(std::string{request.target()}, "/rpc");
        EXPECT_EQ(std::string{request[http::field::host]}, "127.0.0.1:" + server.port());
        EXPECT_EQ(std::string{request[http::field::content_type]}, "application/json");
        EXPECT_THAT(std::string{request[http::field::user_agent]}, HasSubstr("gas-sentinel-"));
        EXPECT_EQ(request.body(), R"({"method":"eth_gasPrice"})");

        http::response<http::string_body> response{http::status::ok, 11};
        response.set(http::field::content_type, "application/json");
        response.body() = R"({"result":"0x1"})";
        return response;
    });

    HttpTransport transport{serverUrl(), kTIMEOUT};
    auto const response = transport.post(R"({"method":"eth_gasPrice"})");
    ASSERT_TRUE(response.has_value()) << response.error();
    EXPECT_EQ(*response, R"({"result":"0x1"})");
}

TEST_F(HttpTransportTests, NonSuccessStatusIsAnError)
{
    server.handleRequest([](auto) -> std::optional<http::response<http::string_body>> {
        http::response<http::string_body> response{http::status::too_many_requests, 11};
        response.body() = "slow down";
        return response;
    });

    HttpTransport transport{serverUrl(), kTIMEOUT};
    auto const response = transport.post("{}");
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error(), "127.0.0.1 responded with HTTP status 429");
}

TEST_F(HttpTransportTests, ConnectionClosedWithoutResponse)
{
    server.handleRequest([](auto) -> std::optional<http::response<http::string_body>> { return std::nullopt; });

    HttpTransport transport{serverUrl(), kTIMEOUT};
    auto const response = transport.post("{}");
    ASSERT_FALSE(response.has_value());
    EXPECT_THAT(response.error(), HasSubstr("reading response from 127.0.0.1 failed"));
}

TEST_F(HttpTransportTests, Timeout)
{
    // the server accepts connections into the backlog but never reads from them
    HttpTransport transport{serverUrl(), std::chrono::milliseconds{100}};

    auto const start = std::chrono::steady_clock::now();
    auto const response = transport.post("{}");
    auto const elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(response.has_value());
    EXPECT_THAT(response.error(), HasSubstr("127.0.0.1"));
    EXPECT_LT(elapsed, std::chrono::seconds{3});
}

TEST_F(HttpTransportTests, ConnectionRefused)
{
    std::string port;
    {
        boost::asio::ip::tcp::acceptor acceptor{ctx_};
        boost::asio::ip::tcp::endpoint const endpoint{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(endpoint.protocol());
        acceptor.bind(endpoint);
        port = std::to_string(acceptor.local_endpoint().port());
    }

    HttpTransport transport{Url{.secure = false, .host = "127.0.0.1", .port = port, .target = "/"}, kTIMEOUT};
    auto const response = transport.post("{}");
    ASSERT_FALSE(response.has_value());
    EXPECT_THAT(response.error(), HasSubstr("connecting to 127.0.0.1:" + port + " failed"));
}
