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

namespace data {

/**
 * @brief Error of loading or persisting one of the sentinel documents
 */
struct StoreError {
    /** @brief What went wrong */
    enum class Kind { CorruptQueue, CorruptLedger, ReadError, PersistenceWriteError };

    Kind kind;
    std::string message;

    StoreError(Kind kind, std::string message) : kind{kind}, message{std::move(message)}
    {
    }

    /**
     * @brief Name of the error kind
     *
     * @param kind The kind
     * @return A stable name, i.e. "CorruptQueue"
     */
    [[nodiscard]] static std::string_view
    kindToString(Kind kind)
    {
        switch (kind) {
            case Kind::CorruptQueue:
                return "CorruptQueue";
            case Kind::CorruptLedger:
                return "CorruptLedger";
            case Kind::ReadError:
                return "ReadError";
            case Kind::PersistenceWriteError:
                return "PersistenceWriteError";
        }
        return "Unknown";
    }

    [[nodiscard]] std::string
    toString() const
    {
        return fmt::format("{}: {}", kindToString(kind), message);
    }

    bool
    operator==(StoreError const&) const = default;

    friend std::ostream&
    operator<<(std::ostream& stream, StoreError const& error)
    {
        return stream << error.toString();
    }
};

}  // namespace data
