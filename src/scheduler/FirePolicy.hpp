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

namespace scheduler {

/**
 * @brief Whether an item may be broadcast at the given base fee
 *
 * Both the item's own threshold and the global ceiling must be satisfied.
 *
 * @param baseFeeGwei Current base fee of the item's chain
 * @param itemMinBaseFeeGwei The item's threshold
 * @param maxFeeGwei The global ceiling
 * @return true if the item should be broadcast now
 */
[[nodiscard]] constexpr bool
shouldFire(std::uint64_t baseFeeGwei, std::uint64_t itemMinBaseFeeGwei, std::uint64_t maxFeeGwei)
{
    return baseFeeGwei <= itemMinBaseFeeGwei and baseFeeGwei <= maxFeeGwei;
}

}  // namespace scheduler
