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
#include "util/build/Build.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/ssl/verify_mode.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>
#include <openssl/ssl.h>

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace chain::impl {

namespace {

namespace http = boost::beast::http;

std::expected<boost::asio::ip::tcp::resolver::results_type, std::string>
resolve(Url const& url, std::chrono::steady_clock::duration timeout, boost::asio::yield_context yield)
{
    boost::asio::ip::tcp::resolver resolver{yield.get_executor()};
    boost::asio::steady_timer deadline{yield.get_executor(), timeout};
    deadline.async_wait([&resolver](boost::system::error_code const& ec) {
        if (not ec)
            resolver.cancel();
    });

    boost::system::error_code ec;
    auto results = resolver.async_resolve(url.host, url.port, yield[ec]);
    deadline.cancel();

    if (ec)
        return std::unexpected{fmt::format("resolving {} failed: {}", url.host, ec.message())};
    return results;
}

template <typename StreamType>
std::expected<std::string, std::string>
exchange(StreamType& stream, Url const& url, std::string const& body, boost::asio::yield_context yield)
{
    http::request<http::string_body> request{http::verb::post, url.target, 11};
    request.set(http::field::host, url.hostHeader());
    request.set(http::field::user_agent, util::build::getSentinelFullVersionString());
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");
    request.body() = body;
    request.prepare_payload();

    boost::system::error_code ec;
    http::async_write(stream, request, yield[ec]);
    if (ec)
        return std::unexpected{fmt::format("sending request to {} failed: {}", url.host, ec.message())};

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::async_read(stream, buffer, response, yield[ec]);
    if (ec)
        return std::unexpected{fmt::format("reading response from {} failed: {}", url.host, ec.message())};

    if (response.result_int() < 200 or response.result_int() >= 300)
        return std::unexpected{fmt::format("{} responded with HTTP status {}", url.host, response.result_int())};

    return std::move(response.body());
}

}  // namespace

HttpTransport::HttpTransport(Url url, std::chrono::steady_clock::duration timeout)
    : url_{std::move(url)}, timeout_{timeout}
{
}

std::expected<std::string, std::string>
HttpTransport::post(std::string const& body)
{
    boost::asio::io_context ioc;
    std::optional<std::expected<std::string, std::string>> result;

    boost::asio::spawn(ioc, [this, &body, &result](boost::asio::yield_context yield) {
        result = url_.secure ? postSecure(body, yield) : postPlain(body, yield);
    });
    ioc.run();

    if (not result.has_value())
        return std::unexpected{std::string{"request was interrupted"}};

    if (not result->has_value())
        LOG(log_.debug()) << "Request to " << url_.hostHeader() << " failed: " << result->error();

    return std::move(result).value();
}

std::expected<std::string, std::string>
HttpTransport::postPlain(std::string const& body, boost::asio::yield_context yield) const
{
    auto const endpoints = resolve(url_, timeout_, yield);
    if (not endpoints.has_value())
        return std::unexpected{endpoints.error()};

    boost::beast::tcp_stream stream{yield.get_executor()};
    stream.expires_after(timeout_);

    boost::system::error_code ec;
    stream.async_connect(endpoints.value(), yield[ec]);
    if (ec)
        return std::unexpected{fmt::format("connecting to {} failed: {}", url_.hostHeader(), ec.message())};

    auto result = exchange(stream, url_, body, yield);
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
}

std::expected<std::string, std::string>
HttpTransport::postSecure(std::string const& body, boost::asio::yield_context yield) const
{
    auto const endpoints = resolve(url_, timeout_, yield);
    if (not endpoints.has_value())
        return std::unexpected{endpoints.error()};

    boost::system::error_code ec;
    boost::asio::ssl::context sslContext{boost::asio::ssl::context::tls_client};
    sslContext.set_default_verify_paths(ec);
    if (ec)
        return std::unexpected{fmt::format("can't load system trust store: {}", ec.message())};

    boost::beast::ssl_stream<boost::beast::tcp_stream> stream{yield.get_executor(), sslContext};
    if (not SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str()))
        return std::unexpected{fmt::format("can't set SNI host name {}", url_.host)};

    stream.set_verify_mode(boost::asio::ssl::verify_peer);
    stream.set_verify_callback(boost::asio::ssl::host_name_verification{url_.host});

    auto& tcpStream = boost::beast::get_lowest_layer(stream);
    tcpStream.expires_after(timeout_);

    tcpStream.async_connect(endpoints.value(), yield[ec]);
    if (ec)
        return std::unexpected{fmt::format("connecting to {} failed: {}", url_.hostHeader(), ec.message())};

    stream.async_handshake(boost::asio::ssl::stream_base::client, yield[ec]);
    if (ec)
        return std::unexpected{fmt::format("TLS handshake with {} failed: {}", url_.hostHeader(), ec.message())};

    // the connection is dropped afterwards, so a TLS shutdown exchange is not needed
    return exchange(stream, url_, body, yield);
}

}  // namespace chain::impl
