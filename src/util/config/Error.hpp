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

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

namespace util::config {

/** @brief Displays the different errors when parsing user config */
struct Error {
    /**
     * @brief Constructs an Error with a custom error message
     *
     * @param key The key associated with the error
     * @param err The error message
     */
    Error(std::string_view key, std::string_view err) : error{fmt::format("{} {}", key, err)}
    {
    }

    /**
     * @brief Constructs an Error with a custom error message
     *
     * @param err The error message
     */
    Error(std::string err) : error{std::move(err)}
    {
    }

    std::string error;
};

}  // namespace util::config
