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

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace chain {

/**
 * @brief Failure of a chain oracle call. Always transient from the scheduler's point of view.
 */
struct OracleError {
    /** @brief Which capability failed */
    enum class Kind { Unavailable, BroadcastRejected };

    Kind kind;
    std::string message;

    OracleError(Kind kind, std::string message) : kind{kind}, message{std::move(message)}
    {
    }

    [[nodiscard]] std::string
    toString() const
    {
        static constexpr std::string_view kUNAVAILABLE = "OracleUnavailable";
        static constexpr std::string_view kREJECTED = "BroadcastRejected";
        return fmt::format("{}: {}", kind == Kind::Unavailable ? kUNAVAILABLE : kREJECTED, message);
    }

    bool
    operator==(OracleError const&) const = default;

    friend std::ostream&
    operator<<(std::ostream& stream, OracleError const& error)
    {
        return stream << error.toString();
    }
};

}  // namespace chain
