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

#include "data/PersistentQueue.hpp"

#include "data/DocumentStoreInterface.hpp"
#include "data/Errors.hpp"
#include "data/Types.hpp"
#include "util/log/Logger.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace data {

namespace {

std::unexpected<StoreError>
corrupt(std::string message)
{
    return std::unexpected{StoreError{StoreError::Kind::CorruptQueue, std::move(message)}};
}

std::expected<std::string, std::string>
requiredString(boost::json::object const& obj, char const* key)
{
    auto const* value = obj.if_contains(key);
    if (value == nullptr)
        return std::unexpected{fmt::format("'{}' is missing", key)};
    if (not value->is_string())
        return std::unexpected{fmt::format("'{}' must be a string", key)};
    return boost::json::value_to<std::string>(*value);
}

std::expected<std::uint64_t, std::string>
optionalCount(boost::json::object const& obj, char const* key, std::uint64_t defaultValue)
{
    auto const* value = obj.if_contains(key);
    if (value == nullptr or value->is_null())
        return defaultValue;
    if (value->is_uint64())
        return value->as_uint64();
    if (value->is_int64() and value->as_int64() >= 0)
        return static_cast<std::uint64_t>(value->as_int64());
    return std::unexpected{fmt::format("'{}' must be a non-negative integer", key)};
}

}  // namespace

PersistentQueue::PersistentQueue(std::shared_ptr<DocumentStoreInterface> store, std::uint64_t defaultMinBaseFeeGwei)
    : store_{std::move(store)}, defaultMinBaseFeeGwei_{defaultMinBaseFeeGwei}
{
}

std::expected<std::vector<QueueItem>, StoreError>
PersistentQueue::load() const
{
    auto const content = store_->read();
    if (not content.has_value())
        return std::unexpected{content.error()};

    if (not content->has_value()) {
        LOG(log_.info()) << "Queue document " << name() << " does not exist, starting with an empty queue";
        return std::vector<QueueItem>{};
    }

    auto const& text = content->value();
    if (boost::algorithm::all(text, boost::algorithm::is_space()))
        return std::vector<QueueItem>{};

    boost::system::error_code ec;
    auto const json = boost::json::parse(text, ec);
    if (ec)
        return corrupt(fmt::format("{} is not valid JSON: {}", name(), ec.message()));

    if (not json.is_array())
        return corrupt(fmt::format("{} must hold a JSON array", name()));

    std::vector<QueueItem> items;
    items.reserve(json.as_array().size());

    for (std::size_t idx = 0; auto const& element : json.as_array()) {
        if (not element.is_object())
            return corrupt(fmt::format("{}: item {} is not an object", name(), idx));

        auto const& obj = element.as_object();
        auto const chain = requiredString(obj, "chain");
        auto const rawTx = requiredString(obj, "rawTx");
        auto const minBaseFee = optionalCount(obj, "minBaseFeeGwei", defaultMinBaseFeeGwei_);
        auto const attempts = optionalCount(obj, "attempts", 0);

        if (not chain.has_value())
            return corrupt(fmt::format("{}: item {}: {}", name(), idx, chain.error()));
        if (not rawTx.has_value())
            return corrupt(fmt::format("{}: item {}: {}", name(), idx, rawTx.error()));
        if (not minBaseFee.has_value())
            return corrupt(fmt::format("{}: item {}: {}", name(), idx, minBaseFee.error()));
        if (not attempts.has_value())
            return corrupt(fmt::format("{}: item {}: {}", name(), idx, attempts.error()));

        std::string label;
        if (auto const* value = obj.if_contains("label"); value != nullptr and not value->is_null()) {
            if (not value->is_string())
                return corrupt(fmt::format("{}: item {}: 'label' must be a string", name(), idx));
            label = boost::json::value_to<std::string>(*value);
        }

        items.push_back(QueueItem{
            .chain = chain.value(),
            .rawTx = rawTx.value(),
            .label = std::move(label),
            .minBaseFeeGwei = minBaseFee.value(),
            .attempts = attempts.value()
        });
        ++idx;
    }

    LOG(log_.info()) << "Loaded " << items.size() << " queued items from " << name();
    return items;
}

std::optional<StoreError>
PersistentQueue::save(std::vector<QueueItem> const& items)
{
    boost::json::array json;
    json.reserve(items.size());
    for (auto const& item : items) {
        json.push_back(boost::json::object{
            {"chain", item.chain},
            {"rawTx", item.rawTx},
            {"label", item.label},
            {"minBaseFeeGwei", item.minBaseFeeGwei},
            {"attempts", item.attempts},
        });
    }

    if (auto const err = store_->write(boost::json::serialize(json)); err.has_value()) {
        LOG(log_.error()) << "Failed to save queue: " << *err;
        return err;
    }

    LOG(log_.debug()) << "Saved " << items.size() << " items to " << name();
    return std::nullopt;
}

std::string
PersistentQueue::name() const
{
    return store_->name();
}

}  // namespace data
