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

#include "chain/ChainOracleInterface.hpp"
#include "chain/ChainRegistry.hpp"
#include "util/MockChainOracle.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"

#include <boost/json/parse.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace chain;
using namespace util::config;
using testing::HasSubstr;

TEST(ChainRegistryTests, FindByName)
{
    auto const ethereum = std::make_shared<MockChainOracle>();
    auto const base = std::make_shared<MockChainOracle>();

    auto const registry = ChainRegistry::make({{"ethereum", ethereum}, {"base", base}});
    ASSERT_TRUE(registry.has_value()) << registry.error();

    EXPECT_EQ(registry->size(), 2);
    EXPECT_EQ(registry->find("ethereum"), ethereum.get());
    EXPECT_EQ(registry->find("base"), base.get());
    EXPECT_EQ(registry->find("polygon"), nullptr);
    EXPECT_EQ(registry->find("Ethereum"), nullptr);
    EXPECT_EQ(registry->names(), (std::vector<std::string>{"base", "ethereum"}));
}

TEST(ChainRegistryTests, Empty)
{
    auto const registry = ChainRegistry::make({});
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error(), "No chains configured");
}

TEST(ChainRegistryTests, DuplicateName)
{
    auto const registry = ChainRegistry::make(
        {{"ethereum", std::make_shared<MockChainOracle>()}, {"ethereum", std::make_shared<MockChainOracle>()}}
    );
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error(), "Chain 'ethereum' is configured more than once");
}

struct MakeChainRegistryTests : testing::Test {
    SentinelConfigDefinition config = makeSentinelConfig();

    void
    parse(std::string const& json)
    {
        ASSERT_FALSE(config.parse(ConfigFileJson{boost::json::parse(json).as_object()}).has_value());
    }
};

TEST_F(MakeChainRegistryTests, FromConfig)
{
    parse(R"json({"chains": [
        {"name": "polygon", "rpc_url": "https://polygon.example.com"},
        {"name": "ethereum", "rpc_url": "http://127.0.0.1:8545/"}
    ]})json");

    auto const registry = makeChainRegistry(config);
    ASSERT_TRUE(registry.has_value()) << registry.error();
    EXPECT_EQ(registry->names(), (std::vector<std::string>{"ethereum", "polygon"}));
    EXPECT_NE(registry->find("polygon"), nullptr);
}

TEST_F(MakeChainRegistryTests, NoChains)
{
    parse("{}");

    auto const registry = makeChainRegistry(config);
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error(), "No chains configured");
}

TEST_F(MakeChainRegistryTests, InvalidRpcUrl)
{
    parse(R"json({"chains": [{"name": "ethereum", "rpc_url": "http://node.example.com:99999"}]})json");

    auto const registry = makeChainRegistry(config);
    ASSERT_FALSE(registry.has_value());
    EXPECT_THAT(registry.error(), HasSubstr("Chain 'ethereum' has invalid rpc_url"));
}

TEST_F(MakeChainRegistryTests, DuplicateChain)
{
    parse(R"json({"chains": [
        {"name": "ethereum", "rpc_url": "https://a.example.com"},
        {"name": "ethereum", "rpc_url": "https://b.example.com"}
    ]})json");

    auto const registry = makeChainRegistry(config);
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error(), "Chain 'ethereum' is configured more than once");
}
