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

#include "chain/Errors.hpp"
#include "chain/JsonRpcOracle.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockJsonRpcTransport.hpp"

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <utility>

using namespace chain;
using testing::HasSubstr;
using testing::Return;

namespace {

constexpr auto kLATEST_BLOCK_REQUEST =
    R"({"jsonrpc":"2.0","id":1,"method":"eth_getBlockByNumber","params":["latest",false]})";

std::string
blockWithBaseFee(std::string const& baseFee)
{
    return R"({"jsonrpc":"2.0","id":1,"result":{"number":"0x10","baseFeePerGas":")" + baseFee + R"("}})";
}

}  // namespace

struct JsonRpcOracleTests : NoLoggerFixture {
    std::unique_ptr<StrictMockJsonRpcTransport> transportOwner = std::make_unique<StrictMockJsonRpcTransport>();
    StrictMockJsonRpcTransport& transport = *transportOwner;
    JsonRpcOracle oracle{"ethereum", std::move(transportOwner)};
};

TEST_F(JsonRpcOracleTests, BaseFeeFromLatestBlock)
{
    EXPECT_CALL(transport, post(kLATEST_BLOCK_REQUEST)).WillOnce(Return(blockWithBaseFee("0x4a817c800")));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_TRUE(fee.has_value());
    EXPECT_EQ(*fee, 20);
}

TEST_F(JsonRpcOracleTests, BaseFeeIsRoundedDown)
{
    EXPECT_CALL(transport, post).WillOnce(Return(blockWithBaseFee("0x4a817c7ff")));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_TRUE(fee.has_value());
    EXPECT_EQ(*fee, 19);
}

TEST_F(JsonRpcOracleTests, RequestIdsIncrease)
{
    EXPECT_CALL(transport, post(HasSubstr(R"("id":1,)"))).WillOnce(Return(blockWithBaseFee("0x0")));
    EXPECT_CALL(transport, post(HasSubstr(R"("id":2,)"))).WillOnce(Return(blockWithBaseFee("0x0")));

    EXPECT_TRUE(oracle.currentBaseFeeGwei().has_value());
    EXPECT_TRUE(oracle.currentBaseFeeGwei().has_value());
}

TEST_F(JsonRpcOracleTests, FallsBackToGasPrice)
{
    testing::InSequence const seq;
    EXPECT_CALL(transport, post(HasSubstr("eth_getBlockByNumber")))
        .WillOnce(Return(R"({"jsonrpc":"2.0","id":1,"result":{"number":"0x10"}})"));
    EXPECT_CALL(transport, post(HasSubstr(R"("method":"eth_gasPrice","params":[])")))
        .WillOnce(Return(R"({"jsonrpc":"2.0","id":2,"result":"0x3b9aca00"})"));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_TRUE(fee.has_value());
    EXPECT_EQ(*fee, 1);
}

TEST_F(JsonRpcOracleTests, UnavailableWhenTransportFails)
{
    EXPECT_CALL(transport, post).Times(2).WillRepeatedly(Return(std::unexpected{std::string{"connection refused"}}));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_FALSE(fee.has_value());
    EXPECT_EQ(fee.error().kind, OracleError::Kind::Unavailable);
    EXPECT_EQ(fee.error().message, "ethereum: eth_gasPrice failed: connection refused");
    EXPECT_EQ(fee.error().toString(), "OracleUnavailable: ethereum: eth_gasPrice failed: connection refused");
}

TEST_F(JsonRpcOracleTests, UnavailableOnMalformedAnswers)
{
    EXPECT_CALL(transport, post(HasSubstr("eth_getBlockByNumber"))).WillOnce(Return(blockWithBaseFee("12")));
    EXPECT_CALL(transport, post(HasSubstr("eth_gasPrice"))).WillOnce(Return("<html>"));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_FALSE(fee.has_value());
    EXPECT_EQ(fee.error().kind, OracleError::Kind::Unavailable);
    EXPECT_THAT(fee.error().message, HasSubstr("malformed response"));
}

TEST_F(JsonRpcOracleTests, UnavailableOnRpcError)
{
    EXPECT_CALL(transport, post)
        .Times(2)
        .WillRepeatedly(Return(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32005,"message":"rate limited"}})"));

    auto const fee = oracle.currentBaseFeeGwei();
    ASSERT_FALSE(fee.has_value());
    EXPECT_EQ(fee.error().message, "ethereum: eth_gasPrice returned error: rate limited");
}

TEST_F(JsonRpcOracleTests, BroadcastAddsPrefix)
{
    EXPECT_CALL(
        transport,
        post(R"({"jsonrpc":"2.0","id":1,"method":"eth_sendRawTransaction","params":["0x02f8b1"]})")
    )
        .WillOnce(Return(R"({"jsonrpc":"2.0","id":1,"result":"0xabc123"})"));

    auto const hash = oracle.broadcastRaw("02f8b1");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, "0xabc123");
}

TEST_F(JsonRpcOracleTests, BroadcastKeepsExistingPrefix)
{
    EXPECT_CALL(transport, post(HasSubstr(R"("params":["0x02f8b1"])")))
        .WillOnce(Return(R"({"jsonrpc":"2.0","id":1,"result":"0xabc123"})"));

    EXPECT_EQ(oracle.broadcastRaw("0x02f8b1"), "0xabc123");
}

TEST_F(JsonRpcOracleTests, BroadcastRejected)
{
    EXPECT_CALL(transport, post)
        .WillOnce(Return(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"nonce too low"}})"));

    auto const hash = oracle.broadcastRaw("0x01");
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().kind, OracleError::Kind::BroadcastRejected);
    EXPECT_EQ(hash.error().toString(), "BroadcastRejected: ethereum: eth_sendRawTransaction returned error: nonce too low");
}

TEST_F(JsonRpcOracleTests, BroadcastWithoutHash)
{
    EXPECT_CALL(transport, post).WillOnce(Return(R"({"jsonrpc":"2.0","id":1,"result":null})"));

    auto const hash = oracle.broadcastRaw("0x01");
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().kind, OracleError::Kind::BroadcastRejected);
    EXPECT_THAT(hash.error().message, HasSubstr("unexpected eth_sendRawTransaction result null"));
}

TEST_F(JsonRpcOracleTests, BroadcastTransportFailure)
{
    EXPECT_CALL(transport, post).WillOnce(Return(std::unexpected{std::string{"timed out"}}));

    auto const hash = oracle.broadcastRaw("0x01");
    ASSERT_FALSE(hash.has_value());
    EXPECT_EQ(hash.error().kind, OracleError::Kind::BroadcastRejected);
    EXPECT_EQ(hash.error().message, "ethereum: eth_sendRawTransaction failed: timed out");
}

TEST(JsonRpcOracleParseQuantityTests, Parse)
{
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0x0"), 0);
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0x3b9aca00"), 1'000'000'000);
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0X3B9ACA00"), 1'000'000'000);
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0xffffffffffffffff"), UINT64_MAX);
}

TEST(JsonRpcOracleParseQuantityTests, Errors)
{
    EXPECT_EQ(JsonRpcOracle::parseQuantity("12").error(), "quantity '12' has no 0x prefix");
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0x").error(), "empty quantity");
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0x1g").error(), "quantity 0x1g is not hex");
    EXPECT_EQ(JsonRpcOracle::parseQuantity("0x10000000000000000").error(), "quantity 0x10000000000000000 is out of range");
}
