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
#include "chain/impl/JsonRpcTransportInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace chain {

/**
 * @brief ChainOracle speaking the Ethereum JSON-RPC API
 *
 * The base fee is read from the latest block; chains without EIP-1559 fall back to `eth_gasPrice`.
 */
class JsonRpcOracle : public ChainOracleInterface {
    util::Logger log_{"Oracle"};
    std::string chain_;
    std::unique_ptr<impl::JsonRpcTransportInterface> transport_;
    std::uint64_t nextRequestId_ = 1;

public:
    static constexpr std::uint64_t kWEI_PER_GWEI = 1'000'000'000;

    /**
     * @brief Construct a new JsonRpcOracle
     *
     * @param chain Name of the chain, used in logs and errors
     * @param transport Transport to the node
     */
    JsonRpcOracle(std::string chain, std::unique_ptr<impl::JsonRpcTransportInterface> transport);

    [[nodiscard]] std::expected<std::uint64_t, OracleError>
    currentBaseFeeGwei() override;

    [[nodiscard]] std::expected<std::string, OracleError>
    broadcastRaw(std::string const& rawTxHex) override;

    /**
     * @brief Parse an Ethereum hex quantity, i.e. "0x3b9aca00"
     *
     * @param quantity The quantity
     * @return The value or a description of the problem
     */
    [[nodiscard]] static std::expected<std::uint64_t, std::string>
    parseQuantity(std::string_view quantity);

private:
    [[nodiscard]] std::expected<boost::json::value, std::string>
    call(std::string_view method, boost::json::array params);

    [[nodiscard]] std::expected<std::uint64_t, std::string>
    baseFeeFromLatestBlock();

    [[nodiscard]] std::expected<std::uint64_t, std::string>
    gasPrice();
};

}  // namespace chain
