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

#include "util/Assert.hpp"

#include <fmt/core.h>
#include <openssl/evp.h>

#include <string>
#include <string_view>

namespace data {

std::string
fingerprint(std::string_view chain, std::string_view rawTx)
{
    auto const input = fmt::format("{}:{}", chain, rawTx);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    auto const rc = EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha1(), nullptr);
    ASSERT(rc == 1, "SHA-1 digest failed for chain {}", chain);

    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i)
        hex += fmt::format("{:02x}", digest[i]);

    return hex;
}

}  // namespace data
