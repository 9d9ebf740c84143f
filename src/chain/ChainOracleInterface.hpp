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

#include "chain/Errors.hpp"

#include <cstdint>
#include <expected>
#include <string>

namespace chain {

/**
 * @brief Per-chain capability used by the scheduler: read the current base fee and submit a signed transaction
 */
class ChainOracleInterface {
public:
    virtual ~ChainOracleInterface() = default;

    /**
     * @brief Current base fee of the chain
     *
     * @return The base fee in whole gwei, rounded down; OracleError of kind Unavailable on failure
     */
    [[nodiscard]] virtual std::expected<std::uint64_t, OracleError>
    currentBaseFeeGwei() = 0;

    /**
     * @brief Submit a signed raw transaction
     *
     * @param rawTxHex The transaction as hex, with or without the 0x prefix
     * @return The transaction hash; OracleError of kind BroadcastRejected on failure
     */
    [[nodiscard]] virtual std::expected<std::string, OracleError>
    broadcastRaw(std::string const& rawTxHex) = 0;
};

}  // namespace chain
