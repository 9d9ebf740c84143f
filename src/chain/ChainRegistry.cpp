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

#include "chain/ChainRegistry.hpp"

#include "chain/ChainOracleInterface.hpp"
#include "chain/JsonRpcOracle.hpp"
#include "chain/impl/HttpTransport.hpp"
#include "chain/impl/Url.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ObjectView.hpp"

#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chain {

ChainRegistry::ChainRegistry(std::map<std::string, std::shared_ptr<ChainOracleInterface>> chains)
    : chains_{std::move(chains)}
{
}

std::expected<ChainRegistry, std::string>
ChainRegistry::make(std::vector<ChainEntry> chains)
{
    if (chains.empty())
        return std::unexpected{std::string{"No chains configured"}};

    std::map<std::string, std::shared_ptr<ChainOracleInterface>> byName;
    for (auto& [name, oracle] : chains) {
        if (byName.contains(name))
            return std::unexpected{fmt::format("Chain '{}' is configured more than once", name)};
        byName.emplace(std::move(name), std::move(oracle));
    }

    return ChainRegistry{std::move(byName)};
}

ChainOracleInterface*
ChainRegistry::find(std::string const& name) const
{
    if (auto const it = chains_.find(name); it != chains_.end())
        return it->second.get();
    return nullptr;
}

std::vector<std::string>
ChainRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(chains_.size());
    for (auto const& [name, _] : chains_)
        result.push_back(name);
    return result;
}

std::size_t
ChainRegistry::size() const
{
    return chains_.size();
}

std::expected<ChainRegistry, std::string>
makeChainRegistry(util::config::SentinelConfigDefinition const& config)
{
    auto const timeout = std::chrono::seconds{config.get<std::uint32_t>("oracle_timeout")};

    std::vector<ChainRegistry::ChainEntry> chains;
    for (auto const& chainConfig : config.getArray("chains")) {
        auto name = chainConfig.get<std::string>("name");
        auto const rpcUrl = chainConfig.get<std::string>("rpc_url");

        auto url = impl::parseUrl(rpcUrl);
        if (not url.has_value())
            return std::unexpected{fmt::format("Chain '{}' has invalid rpc_url: {}", name, url.error())};

        auto transport = std::make_unique<impl::HttpTransport>(std::move(url).value(), timeout);
        auto oracle = std::make_shared<JsonRpcOracle>(name, std::move(transport));
        chains.emplace_back(std::move(name), std::move(oracle));
    }

    return ChainRegistry::make(std::move(chains));
}

}  // namespace chain
