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

#include "util/Random.hpp"

#include "util/Assert.hpp"

#include <cstdint>
#include <random>

namespace util {

std::mt19937_64 Random::generator_{std::random_device{}()};

std::uint64_t
Random::uniform(std::uint64_t min, std::uint64_t max)
{
    ASSERT(min <= max, "Min {} must be less than or equal to max {}", min, max);
    std::uniform_int_distribution<std::uint64_t> distribution{min, max};
    return distribution(generator_);
}

void
Random::setSeed(std::mt19937_64::result_type seed)
{
    generator_.seed(seed);
}

}  // namespace util
