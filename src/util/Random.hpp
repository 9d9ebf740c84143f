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
#include <random>

namespace util {

/**
 * @brief Process-wide source of uniformly distributed random numbers
 */
class Random {
public:
    /**
     * @brief Returns a random number in the closed range [min, max]
     *
     * @param min Lower bound, inclusive
     * @param max Upper bound, inclusive
     * @return A uniformly distributed value
     */
    static std::uint64_t
    uniform(std::uint64_t min, std::uint64_t max);

    /**
     * @brief Reseeds the generator, making subsequent values reproducible
     *
     * @param seed The new seed
     */
    static void
    setSeed(std::mt19937_64::result_type seed);

private:
    static std::mt19937_64 generator_;
};

}  // namespace util
