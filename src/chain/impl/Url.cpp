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

#include "chain/impl/Url.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace chain::impl {

namespace {

constexpr std::string_view kHTTP_SCHEME = "http://";
constexpr std::string_view kHTTPS_SCHEME = "https://";

}  // namespace

std::string
Url::hostHeader() const
{
    auto const hostPart = host.contains(':') ? fmt::format("[{}]", host) : host;
    if ((secure and port == "443") or (not secure and port == "80"))
        return hostPart;
    return fmt::format("{}:{}", hostPart, port);
}

std::expected<Url, std::string>
parseUrl(std::string_view url)
{
    Url result;
    if (boost::istarts_with(url, kHTTPS_SCHEME)) {
        result.secure = true;
        url.remove_prefix(kHTTPS_SCHEME.size());
    } else if (boost::istarts_with(url, kHTTP_SCHEME)) {
        url.remove_prefix(kHTTP_SCHEME.size());
    } else {
        return std::unexpected{"scheme must be http or https"};
    }

    auto const authorityEnd = url.find_first_of("/?#");
    auto authority = url.substr(0, authorityEnd);
    auto const rest = authorityEnd == std::string_view::npos ? std::string_view{} : url.substr(authorityEnd);

    if (authority.contains('@'))
        return std::unexpected{"credentials in URL are not supported"};

    std::string_view portPart;
    if (authority.starts_with('[')) {
        auto const closing = authority.find(']');
        if (closing == std::string_view::npos)
            return std::unexpected{"unterminated IPv6 address"};
        result.host = authority.substr(1, closing - 1);
        auto const afterHost = authority.substr(closing + 1);
        if (not afterHost.empty()) {
            if (not afterHost.starts_with(':'))
                return std::unexpected{"unexpected characters after IPv6 address"};
            portPart = afterHost.substr(1);
            if (portPart.empty())
                return std::unexpected{"empty port"};
        }
    } else {
        auto const colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            portPart = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
            if (portPart.empty())
                return std::unexpected{"empty port"};
        }
        result.host = authority;
    }

    if (result.host.empty())
        return std::unexpected{"host is empty"};

    if (portPart.empty()) {
        result.port = result.secure ? "443" : "80";
    } else {
        std::uint32_t port = 0;
        auto const [ptr, ec] = std::from_chars(portPart.data(), portPart.data() + portPart.size(), port);
        if (ec != std::errc{} or ptr != portPart.data() + portPart.size() or port == 0 or port > 65535)
            return std::unexpected{fmt::format("invalid port '{}'", portPart)};
        result.port = std::to_string(port);
    }

    // fragment is never sent to the server
    auto target = rest.substr(0, rest.find('#'));
    if (target.empty() or target.starts_with('?')) {
        result.target = fmt::format("/{}", target);
    } else {
        result.target = target;
    }

    return result;
}

}  // namespace chain::impl
