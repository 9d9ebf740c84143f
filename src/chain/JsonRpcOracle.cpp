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

#include "chain/JsonRpcOracle.hpp"

#include "chain/Errors.hpp"
#include "chain/impl/JsonRpcTransportInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace chain {

JsonRpcOracle::JsonRpcOracle(std::string chain, std::unique_ptr<impl::JsonRpcTransportInterface> transport)
    : chain_{std::move(chain)}, transport_{std::move(transport)}
{
}

std::expected<std::uint64_t, OracleError>
JsonRpcOracle::currentBaseFeeGwei()
{
    auto wei = baseFeeFromLatestBlock();
    if (not wei.has_value()) {
        LOG(log_.debug()) << chain_ << ": no base fee from latest block (" << wei.error() << "), using eth_gasPrice";
        wei = gasPrice();
    }

    if (not wei.has_value())
        return std::unexpected{OracleError{OracleError::Kind::Unavailable, fmt::format("{}: {}", chain_, wei.error())}};

    LOG(log_.trace()) << chain_ << ": base fee " << *wei << " wei";
    return *wei / kWEI_PER_GWEI;
}

std::expected<std::string, OracleError>
JsonRpcOracle::broadcastRaw(std::string const& rawTxHex)
{
    auto const prefixed =
        rawTxHex.starts_with("0x") or rawTxHex.starts_with("0X") ? rawTxHex : fmt::format("0x{}", rawTxHex);

    auto const result = call("eth_sendRawTransaction", boost::json::array{prefixed});
    if (not result.has_value()) {
        return std::unexpected{
            OracleError{OracleError::Kind::BroadcastRejected, fmt::format("{}: {}", chain_, result.error())}
        };
    }

    if (not result->is_string()) {
        return std::unexpected{OracleError{
            OracleError::Kind::BroadcastRejected,
            fmt::format("{}: unexpected eth_sendRawTransaction result {}", chain_, boost::json::serialize(*result))
        }};
    }

    return boost::json::value_to<std::string>(*result);
}

std::expected<std::uint64_t, std::string>
JsonRpcOracle::parseQuantity(std::string_view quantity)
{
    if (not quantity.starts_with("0x") and not quantity.starts_with("0X"))
        return std::unexpected{fmt::format("quantity '{}' has no 0x prefix", quantity)};

    quantity.remove_prefix(2);
    if (quantity.empty())
        return std::unexpected{std::string{"empty quantity"}};

    std::uint64_t value = 0;
    auto const [ptr, ec] = std::from_chars(quantity.data(), quantity.data() + quantity.size(), value, 16);
    if (ec == std::errc::result_out_of_range)
        return std::unexpected{fmt::format("quantity 0x{} is out of range", quantity)};
    if (ec != std::errc{} or ptr != quantity.data() + quantity.size())
        return std::unexpected{fmt::format("quantity 0x{} is not hex", quantity)};

    return value;
}

std::expected<boost::json::value, std::string>
JsonRpcOracle::call(std::string_view method, boost::json::array params)
{
    boost::json::object request{
        {"jsonrpc", "2.0"},
        {"id", nextRequestId_++},
        {"method", std::string{method}},
        {"params", std::move(params)},
    };

    auto const response = transport_->post(boost::json::serialize(request));
    if (not response.has_value())
        return std::unexpected{fmt::format("{} failed: {}", method, response.error())};

    boost::system::error_code ec;
    auto json = boost::json::parse(response.value(), ec);
    if (ec or not json.is_object())
        return std::unexpected{fmt::format("{} returned a malformed response", method)};

    auto& obj = json.as_object();
    if (auto const* error = obj.if_contains("error"); error != nullptr and not error->is_null()) {
        if (error->is_object()) {
            if (auto const* message = error->as_object().if_contains("message");
                message != nullptr and message->is_string())
                return std::unexpected{fmt::format("{} returned error: {}", method, message->as_string().c_str())};
        }
        return std::unexpected{fmt::format("{} returned error: {}", method, boost::json::serialize(*error))};
    }

    auto* result = obj.if_contains("result");
    if (result == nullptr)
        return std::unexpected{fmt::format("{} returned no result", method)};

    return std::move(*result);
}

std::expected<std::uint64_t, std::string>
JsonRpcOracle::baseFeeFromLatestBlock()
{
    auto const block = call("eth_getBlockByNumber", boost::json::array{"latest", false});
    if (not block.has_value())
        return std::unexpected{block.error()};

    if (not block->is_object())
        return std::unexpected{std::string{"latest block is not an object"}};

    auto const* baseFee = block->as_object().if_contains("baseFeePerGas");
    if (baseFee == nullptr or not baseFee->is_string())
        return std::unexpected{std::string{"latest block has no baseFeePerGas"}};

    return parseQuantity(boost::json::value_to<std::string>(*baseFee));
}

std::expected<std::uint64_t, std::string>
JsonRpcOracle::gasPrice()
{
    auto const price = call("eth_gasPrice", boost::json::array{});
    if (not price.has_value())
        return std::unexpected{price.error()};

    if (not price->is_string())
        return std::unexpected{std::string{"eth_gasPrice result is not a string"}};

    return parseQuantity(boost::json::value_to<std::string>(*price));
}

}  // namespace chain
