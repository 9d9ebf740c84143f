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

#include <expected>
#include <string>
#include <string_view>

namespace chain::impl {

/**
 * @brief The parts of an http(s) URL needed to perform a request
 */
struct Url {
    bool secure = false;
    std::string host;  ///< without brackets for IPv6 literals
    std::string port;
    std::string target;

    /**
     * @return Value of the Host header for this URL
     */
    [[nodiscard]] std::string
    hostHeader() const;

    bool
    operator==(Url const&) const = default;
};

/**
 * @brief Parse an URL of the form `http[s]://host[:port][/path][?query]`
 *
 * @param url The URL
 * @return The parsed URL or a description of what is wrong with it
 */
[[nodiscard]] std::expected<Url, std::string>
parseUrl(std::string_view url);

}  // namespace chain::impl
