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

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace util::config {

/** @brief Custom types for the values a config key may hold */
enum class ConfigType { Integer, String, Double, Boolean };

/**
 * @brief Prints the name of a ConfigType
 *
 * @param stream The output stream
 * @param type The config type
 * @return The same ostream we were given
 */
std::ostream&
operator<<(std::ostream& stream, ConfigType type);

/** @brief Represents the supported config value types */
using Value = std::variant<int64_t, std::string, bool, double>;

/** @cond */
template <typename>
constexpr bool kUNSUPPORTED_TYPE = false;
/** @endcond */

/**
 * @brief Get the corresponding config type of a C++ type
 *
 * @tparam Type The C++ type to map
 * @return The config type for Type
 */
template <typename Type>
constexpr ConfigType
getType()
{
    if constexpr (std::is_same_v<Type, bool>) {
        return ConfigType::Boolean;
    } else if constexpr (std::is_integral_v<Type>) {
        return ConfigType::Integer;
    } else if constexpr (std::is_same_v<Type, std::string>) {
        return ConfigType::String;
    } else if constexpr (std::is_floating_point_v<Type>) {
        return ConfigType::Double;
    } else {
        static_assert(kUNSUPPORTED_TYPE<Type>, "Wrong config type");
    }
}

/**
 * @brief Extract a C++ value of the requested type from a config Value
 *
 * The caller guarantees that the Value holds the type matching getType<T>().
 *
 * @tparam T The requested type
 * @param value The config value
 * @return The value converted to T
 */
template <typename T>
[[nodiscard]] T
castTo(Value const& value)
{
    if constexpr (std::is_same_v<T, bool>) {
        return std::get<bool>(value);
    } else if constexpr (std::is_integral_v<T>) {
        return static_cast<T>(std::get<int64_t>(value));
    } else if constexpr (std::is_same_v<T, std::string>) {
        return std::get<std::string>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        if (std::holds_alternative<int64_t>(value))
            return static_cast<T>(std::get<int64_t>(value));
        return static_cast<T>(std::get<double>(value));
    } else {
        static_assert(kUNSUPPORTED_TYPE<T>, "Wrong config type");
    }
}

}  // namespace util::config
