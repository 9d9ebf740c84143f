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
#include "util/config/ConfigDefinition.hpp"

#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chain {

/**
 * @brief Immutable set of configured chains and their oracles, keyed by chain name
 */
class ChainRegistry {
    std::map<std::string, std::shared_ptr<ChainOracleInterface>> chains_;

    explicit ChainRegistry(std::map<std::string, std::shared_ptr<ChainOracleInterface>> chains);

public:
    using ChainEntry = std::pair<std::string, std::shared_ptr<ChainOracleInterface>>;

    /**
     * @brief Create a registry from named oracles
     *
     * @param chains The chains
     * @return The registry; an error if there are no chains or a name is used twice
     */
    [[nodiscard]] static std::expected<ChainRegistry, std::string>
    make(std::vector<ChainEntry> chains);

    /**
     * @brief Find the oracle of a chain
     *
     * @param name The chain name
     * @return The oracle or nullptr if the chain is not configured
     */
    [[nodiscard]] ChainOracleInterface*
    find(std::string const& name) const;

    /**
     * @return Names of all chains in alphabetical order
     */
    [[nodiscard]] std::vector<std::string>
    names() const;

    /**
     * @return Number of chains
     */
    [[nodiscard]] std::size_t
    size() const;
};

/**
 * @brief Create the registry of JSON-RPC oracles described by the `chains` config array
 *
 * @param config The parsed config
 * @return The registry; an error for an empty chain list, a duplicated name or an invalid rpc_url
 */
[[nodiscard]] std::expected<ChainRegistry, std::string>
makeChainRegistry(util::config::SentinelConfigDefinition const& config);

}  // namespace chain
