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

#include "data/BroadcastLedger.hpp"

#include "data/DocumentStoreInterface.hpp"
#include "data/Errors.hpp"
#include "data/Types.hpp"
#include "util/log/Logger.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_to.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace data {

namespace {

StoreError
corrupt(std::string message)
{
    return StoreError{StoreError::Kind::CorruptLedger, std::move(message)};
}

}  // namespace

BroadcastLedger::BroadcastLedger(std::shared_ptr<DocumentStoreInterface> store) : store_{std::move(store)}
{
}

std::optional<StoreError>
BroadcastLedger::load()
{
    auto const content = store_->read();
    if (not content.has_value())
        return content.error();

    records_.clear();
    dirty_ = false;

    if (not content->has_value() or boost::algorithm::all(content->value(), boost::algorithm::is_space())) {
        LOG(log_.info()) << "Ledger document " << store_->name() << " is absent or empty, starting with no records";
        return std::nullopt;
    }

    boost::system::error_code ec;
    auto const json = boost::json::parse(content->value(), ec);
    if (ec)
        return corrupt(fmt::format("{} is not valid JSON: {}", store_->name(), ec.message()));

    if (not json.is_object())
        return corrupt(fmt::format("{} must hold a JSON object", store_->name()));

    auto const* broadcasted = json.as_object().if_contains("broadcasted");
    if (broadcasted == nullptr)
        return std::nullopt;

    if (not broadcasted->is_object())
        return corrupt(fmt::format("{}: 'broadcasted' must be an object", store_->name()));

    std::map<std::string, BroadcastRecord> records;
    for (auto const& kv : broadcasted->as_object()) {
        std::string fingerprint{kv.key().data(), kv.key().size()};
        auto const& entry = kv.value();
        if (not entry.is_object())
            return corrupt(fmt::format("{}: record {} is not an object", store_->name(), fingerprint));

        auto const& obj = entry.as_object();
        auto const* hash = obj.if_contains("hash");
        if (hash == nullptr or not hash->is_string())
            return corrupt(fmt::format("{}: record {} has no string 'hash'", store_->name(), fingerprint));

        std::int64_t ts = 0;
        if (auto const* value = obj.if_contains("ts"); value != nullptr) {
            if (value->is_int64()) {
                ts = value->as_int64();
            } else if (value->is_uint64()) {
                return corrupt(fmt::format("{}: record {} has 'ts' out of range", store_->name(), fingerprint));
            } else {
                return corrupt(fmt::format("{}: record {} has non integer 'ts'", store_->name(), fingerprint));
            }
        }

        auto record = BroadcastRecord{
            .fingerprint = fingerprint, .txHash = boost::json::value_to<std::string>(*hash), .broadcastAtUnixSeconds = ts
        };
        records.emplace(std::move(fingerprint), std::move(record));
    }

    records_ = std::move(records);
    LOG(log_.info()) << "Loaded " << records_.size() << " broadcast records from " << store_->name();
    return std::nullopt;
}

bool
BroadcastLedger::contains(std::string const& fingerprint) const
{
    return records_.contains(fingerprint);
}

bool
BroadcastLedger::record(std::string const& fingerprint, std::string const& txHash, std::int64_t broadcastAtUnixSeconds)
{
    auto const [it, inserted] = records_.try_emplace(
        fingerprint,
        BroadcastRecord{.fingerprint = fingerprint, .txHash = txHash, .broadcastAtUnixSeconds = broadcastAtUnixSeconds}
    );

    if (not inserted) {
        LOG(log_.warn()) << "Fingerprint " << fingerprint << " is already recorded with hash " << it->second.txHash;
        return false;
    }

    dirty_ = true;
    return true;
}

std::optional<BroadcastRecord>
BroadcastLedger::find(std::string const& fingerprint) const
{
    if (auto const it = records_.find(fingerprint); it != records_.end())
        return it->second;
    return std::nullopt;
}

std::size_t
BroadcastLedger::size() const
{
    return records_.size();
}

std::optional<StoreError>
BroadcastLedger::save()
{
    boost::json::object broadcasted;
    for (auto const& [fingerprint, record] : records_)
        broadcasted[fingerprint] = boost::json::object{{"hash", record.txHash}, {"ts", record.broadcastAtUnixSeconds}};

    boost::json::object json;
    json["broadcasted"] = std::move(broadcasted);

    if (auto const err = store_->write(boost::json::serialize(json)); err.has_value()) {
        LOG(log_.error()) << "Failed to save ledger: " << *err;
        return err;
    }

    dirty_ = false;
    LOG(log_.debug()) << "Saved " << records_.size() << " records to " << store_->name();
    return std::nullopt;
}

bool
BroadcastLedger::isDirty() const
{
    return dirty_;
}

}  // namespace data
