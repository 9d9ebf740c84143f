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

#include "chain/ChainOracleInterface.hpp"
#include "chain/Errors.hpp"

#include <gmock/gmock.h>

#include <cstdint>
#include <expected>
#include <string>

struct MockChainOracleImpl : chain::ChainOracleInterface {
    using BaseFeeReturnType = std::expected<std::uint64_t, chain::OracleError>;
    MOCK_METHOD(BaseFeeReturnType, currentBaseFeeGwei, (), (override));

    using BroadcastReturnType = std::expected<std::string, chain::OracleError>;
    MOCK_METHOD(BroadcastReturnType, broadcastRaw, (std::string const&), (override));
};

using MockChainOracle = testing::NiceMock<MockChainOracleImpl>;
using StrictMockChainOracle = testing::StrictMock<MockChainOracleImpl>;
