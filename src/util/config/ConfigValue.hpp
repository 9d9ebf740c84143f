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
#include "util/config/ConfigConstraints.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/core.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace util::config {

/**
 * @brief Represents the config values for Json config
 *
 * Used in SentinelConfigDefinition to indicate the required type of value and
 * whether it is mandatory to specify in the configuration
 */
class ConfigValue {
public:
    /**
     * @brief Constructor initializing with the config type
     *
     * @param type The type of the config value
     */
    constexpr ConfigValue(ConfigType type) : type_(type)
    {
    }

    /**
     * @brief Sets the default value for the config
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(Value value)
    {
        auto const err = checkTypeConsistency(type_, value);
        ASSERT(!err.has_value(), "{}", err.has_value() ? err->error : std::string{});
        value_ = std::move(value);
        return *this;
    }

    /**
     * @brief Sets the default value for a string config from a literal
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(char const* value)
    {
        return defaultValue(Value{std::string{value}});
    }

    /**
     * @brief Sets the value current ConfigValue given by the user's config
     *
     * @param value The value to set
     * @param key The Config key associated with the value. Optional to include; used for debugging message to user.
     * @return Optional Error if user tries to set a value of wrong type or not within a constraint
     */
    [[nodiscard]] std::optional<Error>
    setValue(Value value, std::optional<std::string_view> key = std::nullopt)
    {
        auto err = checkTypeConsistency(type_, value);
        if (err.has_value()) {
            if (key.has_value())
                err->error = fmt::format("{} {}", key.value(), err->error);
            return err;
        }

        if (type_ == ConfigType::Double and std::holds_alternative<int64_t>(value))
            value = static_cast<double>(std::get<int64_t>(value));

        if (cons_.has_value()) {
            auto constraintCheck = cons_->get().checkConstraint(value);
            if (constraintCheck.has_value()) {
                if (key.has_value())
                    constraintCheck->error = fmt::format("{} {}", key.value(), constraintCheck->error);
                return constraintCheck;
            }
        }
        value_ = std::move(value);
        return std::nullopt;
    }

    /**
     * @brief Assigns a constraint to the ConfigValue.
     *
     * The constraint must outlive the ConfigValue; all shipped constraints are static.
     *
     * @param cons The constraint to be applied to the ConfigValue
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    withConstraint(Constraint const& cons)
    {
        cons_ = std::reference_wrapper<Constraint const>(cons);
        ASSERT(cons_.has_value(), "Constraint must be defined");

        if (value_.has_value()) {
            auto const& temp = cons_.value().get();
            auto const result = temp.checkConstraint(value_.value());
            ASSERT(
                !result.has_value(),
                "Default value does not satisfy the constraint: {}",
                result.has_value() ? result->error : std::string{}
            );
        }
        return *this;
    }

    /**
     * @brief Retrieves the constraint associated with this ConfigValue, if any.
     *
     * @return An optional reference to the associated Constraint.
     */
    [[nodiscard]] std::optional<std::reference_wrapper<Constraint const>>
    getConstraint() const
    {
        return cons_;
    }

    /**
     * @brief Gets the config type
     *
     * @return The config type
     */
    [[nodiscard]] constexpr ConfigType
    type() const
    {
        return type_;
    }

    /**
     * @brief Sets the config value as optional, meaning the user doesn't have to provide the value in their config
     *
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] constexpr ConfigValue&
    optional()
    {
        optional_ = true;
        return *this;
    }

    /**
     * @brief Checks if configValue is optional
     *
     * @return true if optional, false otherwise
     */
    [[nodiscard]] constexpr bool
    isOptional() const
    {
        return optional_;
    }

    /**
     * @brief Check if a value (user provided or default) is set
     *
     * @return true if a value is set, false otherwise
     */
    [[nodiscard]] constexpr bool
    hasValue() const
    {
        return value_.has_value();
    }

    /**
     * @brief Get the value of config
     *
     * @return Config Value
     */
    [[nodiscard]] Value const&
    getValue() const
    {
        ASSERT(value_.has_value(), "getValue() is called when there is no value set");
        return value_.value();
    }

private:
    /**
     * @brief Checks if the value type is consistent with the specified ConfigType
     *
     * @param type The config type
     * @param value The config value
     * @return Error if type and value mismatch
     */
    static std::optional<Error>
    checkTypeConsistency(ConfigType type, Value value)
    {
        if (type == ConfigType::String && !std::holds_alternative<std::string>(value))
            return Error{"value does not match type string"};
        if (type == ConfigType::Boolean && !std::holds_alternative<bool>(value))
            return Error{"value does not match type boolean"};
        if (type == ConfigType::Double && !std::holds_alternative<double>(value) &&
            !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type double"};
        if (type == ConfigType::Integer && !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type integer"};
        return std::nullopt;
    }

    ConfigType type_{};
    bool optional_{false};
    std::optional<Value> value_;
    std::optional<std::reference_wrapper<Constraint const>> cons_;
};

}  // namespace util::config
