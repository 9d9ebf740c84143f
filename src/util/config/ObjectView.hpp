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

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace util::config {

class SentinelConfigDefinition;

/**
 * @brief Provides a view into one element of an array of objects in the config
 *
 * For the config key "chains.[].name", the ObjectView over prefix "chains" at index 1 reads "name" of the second
 * chain entry.
 */
class ObjectView {
public:
    /**
     * @brief Constructs an ObjectView for the element at the given index of an array of objects
     *
     * @param prefix The key prefix of the array of objects, i.e. "chains"
     * @param arrayIndex The index of the element
     * @param configDef The config definition holding the values
     */
    ObjectView(std::string_view prefix, std::size_t arrayIndex, SentinelConfigDefinition const& configDef);

    /**
     * @brief Returns the value of a field in this element
     *
     * @tparam T The type of the value
     * @param key The field name, without prefix
     * @return The value of the field
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view key) const;

    /**
     * @brief Returns the value of an optional field in this element
     *
     * @tparam T The type of the value
     * @param key The field name, without prefix
     * @return The value if set, nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view key) const;

    /**
     * @brief Checks if the given field is defined for this array of objects
     *
     * @param key The field name, without prefix
     * @return true if defined, false otherwise
     */
    [[nodiscard]] bool
    containsKey(std::string_view key) const;

private:
    [[nodiscard]] std::string
    getFullKey(std::string_view key) const;

    std::string prefix_;
    std::size_t arrayIndex_;
    std::reference_wrapper<SentinelConfigDefinition const> configDef_;
};

}  // namespace util::config
