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

#include <cstdint>
#include <string>

namespace data {

/**
 * @brief A pre-signed transaction waiting for its chain's base fee to drop under a threshold
 */
struct QueueItem {
    std::string chain;
    std::string rawTx;
    std::string label;
    std::uint64_t minBaseFeeGwei = 0;
    std::uint64_t attempts = 0;

    bool
    operator==(QueueItem const&) const = default;
};

/**
 * @brief Proof that the transaction with the given fingerprint has been accepted by its chain
 */
struct BroadcastRecord {
    std::string fingerprint;
    std::string txHash;
    std::int64_t broadcastAtUnixSeconds = 0;

    bool
    operator==(BroadcastRecord const&) const = default;
};

}  // namespace data
