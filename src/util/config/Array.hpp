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

#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace util::config {

/**
 * @brief Array definition to store multiple values provided by the user from Json config
 *
 * Used in SentinelConfigDefinition to represent multiple potential values (like chains or log channels).
 * All elements share the type, optionality and constraint of the item pattern given at construction.
 */
class Array {
public:
    /**
     * @brief Constructs an Array with provided Arg
     *
     * @param arg Argument to set the type and constraint of ConfigValues in Array
     */
    Array(ConfigValue arg) : itemPattern_{std::move(arg)}
    {
    }

    /**
     * @brief Add ConfigValues to Array class
     *
     * @param value The ConfigValue to add
     * @param key optional string key to include that will show in error message
     * @return optional error if adding config value to array fails. nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addValue(Value value, std::optional<std::string_view> key = std::nullopt);

    /**
     * @brief Add an element for which the user provided no value
     *
     * @param key The key of the array, used in the error message
     * @return Error if the item pattern is neither optional nor has a default value. nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addMissing(std::string_view key);

    /**
     * @brief Returns the number of values stored in the Array
     *
     * @return Number of values stored in the Array
     */
    [[nodiscard]] size_t
    size() const;

    /**
     * @brief Returns the ConfigValue at the specified index
     *
     * @param idx Index of the ConfigValue to retrieve
     * @return ConfigValue at the specified index
     */
    [[nodiscard]] ConfigValue const&
    at(std::size_t idx) const;

    /**
     * @brief Returns the ConfigValue that defines the type, constraint and optionality of every element
     *
     * @return The item pattern
     */
    [[nodiscard]] ConfigValue const&
    getArrayPattern() const;

private:
    ConfigValue itemPattern_;
    std::vector<ConfigValue> elements_;
};

}  // namespace util::config
