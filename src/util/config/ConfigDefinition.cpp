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

#include "util/config/ConfigDefinition.hpp"

#include "util/Assert.hpp"
#include "util/OverloadSet.hpp"
#include "util/config/Array.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigConstraints.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace util::config {

namespace {

[[nodiscard]] std::string_view
arrayPrefixOf(std::string_view key)
{
    return key.substr(0, key.find(".[]"));
}

}  // namespace

SentinelConfigDefinition::SentinelConfigDefinition(std::initializer_list<KeyValuePair> pair)
{
    for (auto const& [key, value] : pair) {
        if (key.contains("[]"))
            ASSERT(std::holds_alternative<Array>(value), "Value of key {} must be an Array", key);
        map_.insert({key, value});
    }
}

ConfigValue const&
SentinelConfigDefinition::getValueView(std::string_view fullKey) const
{
    auto const it = map_.find(fullKey);
    ASSERT(it != map_.end(), "key {} does not exist in config", fullKey);
    ASSERT(std::holds_alternative<ConfigValue>(it->second), "Value of {} is not a ConfigValue", fullKey);
    return std::get<ConfigValue>(it->second);
}

ConfigValue const&
SentinelConfigDefinition::getArrayElement(std::string_view fullKey, std::size_t index) const
{
    auto const it = map_.find(fullKey);
    ASSERT(it != map_.end(), "key {} does not exist in config", fullKey);
    ASSERT(std::holds_alternative<Array>(it->second), "Value of {} is not an Array", fullKey);
    return std::get<Array>(it->second).at(index);
}

ArrayView
SentinelConfigDefinition::getArray(std::string_view prefix) const
{
    ASSERT(arraySize(prefix) > 0 or std::ranges::any_of(map_, [prefix](auto const& pair) {
               return std::holds_alternative<Array>(pair.second) and arrayPrefixOf(pair.first) == prefix;
           }),
           "No array with prefix {} in config definition",
           prefix);
    return ArrayView{prefix, *this};
}

std::size_t
SentinelConfigDefinition::arraySize(std::string_view prefix) const
{
    std::size_t size = 0;
    for (auto const& [key, value] : map_) {
        if (auto const* arr = std::get_if<Array>(&value); arr != nullptr and arrayPrefixOf(key) == prefix)
            size = std::max(size, arr->size());
    }
    return size;
}

bool
SentinelConfigDefinition::contains(std::string_view key) const
{
    return map_.contains(key);
}

std::optional<std::vector<Error>>
SentinelConfigDefinition::parse(ConfigFileInterface const& config)
{
    std::vector<Error> listOfErrors;
    for (auto& [key, value] : map_) {
        std::visit(
            util::OverloadSet{
                [&config, &listOfErrors, &key](ConfigValue& val) {
                    if (not config.containsKey(key)) {
                        if (not val.hasValue() and not val.isOptional())
                            listOfErrors.emplace_back(key, "key is required in user Config");
                        return;
                    }

                    auto const userValue = config.getValue(key);
                    if (not userValue.has_value()) {
                        if (not val.hasValue() and not val.isOptional())
                            listOfErrors.emplace_back(key, "value must be a string, number or boolean");
                        return;
                    }

                    if (auto const maybeError = val.setValue(userValue.value(), key); maybeError.has_value())
                        listOfErrors.emplace_back(maybeError.value());
                },
                [&config, &listOfErrors, &key](Array& arr) {
                    if (not config.containsKey(key))
                        return;

                    for (auto const& elem : config.getArray(key)) {
                        auto const maybeError = elem.has_value() ? arr.addValue(elem.value(), key) : arr.addMissing(key);
                        if (maybeError.has_value())
                            listOfErrors.emplace_back(maybeError.value());
                    }
                },
            },
            value
        );
    }

    // a field left out of every element of an array of objects never reached the visitor above
    for (auto& [key, value] : map_) {
        auto* arr = std::get_if<Array>(&value);
        if (arr == nullptr)
            continue;

        auto const expectedSize = arraySize(arrayPrefixOf(key));
        while (arr->size() < expectedSize) {
            if (auto const maybeError = arr->addMissing(key); maybeError.has_value()) {
                listOfErrors.emplace_back(maybeError.value());
                break;
            }
        }
    }

    if (!listOfErrors.empty())
        return listOfErrors;

    return std::nullopt;
}

SentinelConfigDefinition
makeSentinelConfig()
{
    return SentinelConfigDefinition{
        {"chains.[].name", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateNonEmptyString)}},
        {"chains.[].rpc_url", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateUrl)}},

        {"max_fee_gwei", ConfigValue{ConfigType::Integer}.defaultValue(20).withConstraint(gValidateUint63)},
        {"poll_interval", ConfigValue{ConfigType::Integer}.defaultValue(15).withConstraint(gValidatePositiveUint32)},
        {"jitter", ConfigValue{ConfigType::Integer}.defaultValue(5).withConstraint(gValidateUint32)},
        {"queue_save_interval",
         ConfigValue{ConfigType::Integer}.defaultValue(20).withConstraint(gValidatePositiveUint32)},
        {"oracle_timeout", ConfigValue{ConfigType::Integer}.defaultValue(10).withConstraint(gValidatePositiveUint32)},

        {"queue_file", ConfigValue{ConfigType::String}.defaultValue("queue.json").withConstraint(gValidateNonEmptyString)
        },
        {"state_file", ConfigValue{ConfigType::String}.defaultValue("state.json").withConstraint(gValidateNonEmptyString)
        },

        {"log_channels.[].channel", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateChannelName)}},
        {"log_channels.[].log_level", Array{ConfigValue{ConfigType::String}.withConstraint(gValidateLogLevelName)}},

        {"log_level", ConfigValue{ConfigType::String}.defaultValue("info").withConstraint(gValidateLogLevelName)},
        {"log_format",
         ConfigValue{ConfigType::String}.defaultValue(
             R"(%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%)"
         )},
        {"log_to_console", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
        {"log_directory", ConfigValue{ConfigType::String}.optional()},
        {"log_rotation_size", ConfigValue{ConfigType::Integer}.defaultValue(2048).withConstraint(gValidateUint32)},
        {"log_directory_max_size",
         ConfigValue{ConfigType::Integer}.defaultValue(50 * 1024).withConstraint(gValidateUint32)},
        {"log_rotation_hour_interval",
         ConfigValue{ConfigType::Integer}.defaultValue(12).withConstraint(gValidatePositiveUint32)},
    };
}

}  // namespace util::config
