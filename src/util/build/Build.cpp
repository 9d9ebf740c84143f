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

#include "util/build/Build.hpp"

#include <string>

namespace util::build {

#ifndef SENTINEL_VERSION
#error "SENTINEL_VERSION must be defined"
#endif
char const* const kVERSION_STRING = SENTINEL_VERSION;

std::string const&
getSentinelVersionString()
{
    static std::string const value = kVERSION_STRING;  // NOLINT(readability-identifier-naming)
    return value;
}

std::string const&
getSentinelFullVersionString()
{
    static std::string const value = "gas-sentinel-" + getSentinelVersionString();  // NOLINT(readability-identifier-naming)
    return value;
}

}  // namespace util::build
