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

#include "util/Assert.hpp"
#include "util/config/Array.hpp"
#include "util/config/ArrayView.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/ObjectView.hpp"
#include "util/config/Types.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

/**
 * @brief All the config data will be stored and extracted from this class
 *
 * Represents all the possible config data
 */
class SentinelConfigDefinition {
public:
    using KeyValuePair = std::pair<std::string_view, std::variant<ConfigValue, Array>>;

    /**
     * @brief Constructs a new SentinelConfigDefinition
     *
     * Initializes the configuration with a predefined set of key-value pairs
     * If a key contains "[]", the corresponding value must be an Array
     *
     * @param pair A list of key-value pairs for the predefined set of sentinel configurations
     */
    SentinelConfigDefinition(std::initializer_list<KeyValuePair> pair);

    /**
     * @brief Parses the configuration file
     *
     * Keys present in the file but unknown to the definition are ignored.
     *
     * @param config The configuration file interface
     * @return An optional vector of Error objects stating all the failures if parsing fails
     */
    [[nodiscard]] std::optional<std::vector<Error>>
    parse(ConfigFileInterface const& config);

    /**
     * @brief Returns the value of a config key
     *
     * @tparam T The type of the value
     * @param fullKey The full config key
     * @return The value of the key; asserts if the key is unknown or has no value
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view fullKey) const
    {
        auto const& configValue = getValueView(fullKey);
        ASSERT(configValue.hasValue(), "Value of key {} is not set", fullKey);
        ASSERT(configValue.type() == getType<T>(), "Value of key {} is requested with a wrong type", fullKey);
        return castTo<T>(configValue.getValue());
    }

    /**
     * @brief Returns the value of an optional config key
     *
     * @tparam T The type of the value
     * @param fullKey The full config key
     * @return The value if set, nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view fullKey) const
    {
        auto const& configValue = getValueView(fullKey);
        if (not configValue.hasValue())
            return std::nullopt;
        ASSERT(configValue.type() == getType<T>(), "Value of key {} is requested with a wrong type", fullKey);
        return castTo<T>(configValue.getValue());
    }

    /**
     * @brief Returns the ConfigValue of a non-array key
     *
     * @param fullKey The full config key
     * @return The ConfigValue
     */
    [[nodiscard]] ConfigValue const&
    getValueView(std::string_view fullKey) const;

    /**
     * @brief Returns the element of an array key at the given index
     *
     * @param fullKey The full array key, i.e. "chains.[].name"
     * @param index The element index
     * @return The ConfigValue of that element
     */
    [[nodiscard]] ConfigValue const&
    getArrayElement(std::string_view fullKey, std::size_t index) const;

    /**
     * @brief Returns a view over an array of objects
     *
     * @param prefix The key prefix, i.e. "chains"
     * @return The ArrayView
     */
    [[nodiscard]] ArrayView
    getArray(std::string_view prefix) const;

    /**
     * @brief Returns the number of elements of the array of objects with the given prefix
     *
     * @param prefix The key prefix, i.e. "chains"
     * @return The number of elements; 0 if none were configured
     */
    [[nodiscard]] std::size_t
    arraySize(std::string_view prefix) const;

    /**
     * @brief Checks if a key is part of the definition
     *
     * @param key The full config key
     * @return true if present, false otherwise
     */
    [[nodiscard]] bool
    contains(std::string_view key) const;

    /**
     * @brief Returns an iterator to the beginning of the definition
     *
     * @return Constant iterator
     */
    [[nodiscard]] auto
    begin() const
    {
        return map_.begin();
    }

    /**
     * @brief Returns an iterator to the end of the definition
     *
     * @return Constant iterator
     */
    [[nodiscard]] auto
    end() const
    {
        return map_.end();
    }

private:
    std::unordered_map<std::string_view, std::variant<ConfigValue, Array>> map_;
};

/**
 * @brief Creates the full gas-sentinel config definition with defaults and constraints for every known key
 *
 * @return The config definition, not yet parsed
 */
[[nodiscard]] SentinelConfigDefinition
makeSentinelConfig();

template <typename T>
T
ObjectView::get(std::string_view key) const
{
    auto const fullKey = getFullKey(key);
    auto const& configValue = configDef_.get().getArrayElement(fullKey, arrayIndex_);
    ASSERT(configValue.hasValue(), "Value of key {} at index {} is not set", fullKey, arrayIndex_);
    return castTo<T>(configValue.getValue());
}

template <typename T>
std::optional<T>
ObjectView::maybeValue(std::string_view key) const
{
    auto const fullKey = getFullKey(key);
    auto const& configValue = configDef_.get().getArrayElement(fullKey, arrayIndex_);
    if (not configValue.hasValue())
        return std::nullopt;
    return castTo<T>(configValue.getValue());
}

}  // namespace util::config
