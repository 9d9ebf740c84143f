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

#pragma once

#include "chain/impl/JsonRpcTransportInterface.hpp"
#include "chain/impl/Url.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/spawn.hpp>

#include <chrono>
#include <expected>
#include <string>

namespace chain::impl {

/**
 * @brief JSON-RPC over HTTP/1.1 POST, plain or TLS
 *
 * Every request runs on its own io_context and is bounded by the timeout, which covers name resolution, connection,
 * TLS handshake, writing the request and reading the response. TLS peers are verified against the system trust
 * store and the host name.
 */
class HttpTransport : public JsonRpcTransportInterface {
    util::Logger log_{"Oracle"};
    Url url_;
    std::chrono::steady_clock::duration timeout_;

public:
    /**
     * @brief Construct a new HttpTransport
     *
     * @param url Endpoint of the node
     * @param timeout Upper bound of one request
     */
    HttpTransport(Url url, std::chrono::steady_clock::duration timeout);

    [[nodiscard]] std::expected<std::string, std::string>
    post(std::string const& body) override;

private:
    [[nodiscard]] std::expected<std::string, std::string>
    postPlain(std::string const& body, boost::asio::yield_context yield) const;

    [[nodiscard]] std::expected<std::string, std::string>
    postSecure(std::string const& body, boost::asio::yield_context yield) const;
};

}  // namespace chain::impl
