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

#include "data/Fingerprint.hpp"

#include <gtest/gtest.h>

using namespace data;

TEST(FingerprintTests, KnownValue)
{
    EXPECT_EQ(fingerprint("ethereum", "0xdeadbeef"), "e002e15583f7767cb2419a44e0f38fef3ec7a631");
    EXPECT_EQ(fingerprint("", ""), "05a79f06cf3f67f726dae68d18a2290f6c9a50c9");
}

TEST(FingerprintTests, DependsOnChain)
{
    EXPECT_EQ(fingerprint("base", "0xdeadbeef"), "eb48db7b74f2d5908493309703ef5126542f0da1");
    EXPECT_NE(fingerprint("base", "0xdeadbeef"), fingerprint("ethereum", "0xdeadbeef"));
}

TEST(FingerprintTests, RawTxIsTakenVerbatim)
{
    EXPECT_NE(fingerprint("ethereum", "0xdeadbeef"), fingerprint("ethereum", "deadbeef"));
    EXPECT_NE(fingerprint("ethereum", "0xdeadbeef"), fingerprint("ethereum", "0xDEADBEEF"));
}

TEST(FingerprintTests, IsLowercaseHex)
{
    auto const fp = fingerprint("polygon", "0x02f8b1");
    ASSERT_EQ(fp.size(), 40);
    for (auto const c : fp)
        EXPECT_TRUE((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f')) << c;
}
