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

#include "util/config/ConfigFileJson.hpp"

#include "util/Assert.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util::config {

namespace {

/**
 * @brief Extracts the value from a JSON object and converts it into the corresponding type.
 *
 * @param jsonValue The JSON value to extract.
 * @return A variant containing the same type corresponding to the extracted value, nullopt for null or unsupported.
 */
[[nodiscard]] std::optional<Value>
extractJsonValue(boost::json::value const& jsonValue)
{
    if (jsonValue.is_int64())
        return jsonValue.as_int64();
    if (jsonValue.is_uint64()) {
        auto const value = jsonValue.as_uint64();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return std::nullopt;
        return static_cast<int64_t>(value);
    }
    if (jsonValue.is_string())
        return std::string{jsonValue.as_string().c_str()};
    if (jsonValue.is_bool())
        return jsonValue.as_bool();
    if (jsonValue.is_double())
        return jsonValue.as_double();

    return std::nullopt;
}

}  // namespace

ConfigFileJson::ConfigFileJson(boost::json::object jsonObj)
{
    flattenJson(jsonObj, "");
}

std::expected<ConfigFileJson, Error>
ConfigFileJson::makeConfigFileJson(std::string_view configFilePath)
{
    try {
        std::ifstream const in(std::string{configFilePath}, std::ios::in | std::ios::binary);
        if (in) {
            std::stringstream contents;
            contents << in.rdbuf();
            auto opts = boost::json::parse_options{};
            opts.allow_comments = true;
            auto const tempObj = boost::json::parse(contents.str(), {}, opts);
            if (!tempObj.is_object())
                return std::unexpected<Error>(fmt::format("Config file {} must contain a JSON object", configFilePath));
            return ConfigFileJson{tempObj.as_object()};
        }
        return std::unexpected<Error>(
            Error{fmt::format("Could not open configuration file '{}'", configFilePath)}
        );

    } catch (std::exception const& e) {
        return std::unexpected<Error>(Error{fmt::format(
            "An error occurred while processing configuration file '{}': {}", configFilePath, e.what()
        )});
    }
}

std::optional<Value>
ConfigFileJson::getValue(std::string_view key) const
{
    auto const jsonValue = jsonObject_.at(key);
    return extractJsonValue(jsonValue);
}

std::vector<std::optional<Value>>
ConfigFileJson::getArray(std::string_view key) const
{
    ASSERT(jsonObject_.at(key).is_array(), "Key {} has value that is not an array", key);

    std::vector<std::optional<Value>> configValues;
    auto const arr = jsonObject_.at(key).as_array();

    for (auto const& item : arr)
        configValues.push_back(extractJsonValue(item));

    return configValues;
}

bool
ConfigFileJson::containsKey(std::string_view key) const
{
    return jsonObject_.contains(key);
}

void
ConfigFileJson::flattenJson(boost::json::object const& obj, std::string const& prefix)
{
    for (auto const& [key, value] : obj) {
        auto const keyStr = std::string{key.data(), key.size()};
        auto const fullKey = prefix.empty() ? keyStr : fmt::format("{}.{}", prefix, keyStr);

        if (value.is_object()) {
            flattenJson(value.as_object(), fullKey);
            continue;
        }

        if (not value.is_array()) {
            jsonObject_[fullKey] = value;
            continue;
        }

        auto const& arr = value.as_array();
        auto const arrayPrefix = fullKey + ".[]";

        std::set<std::string> fields;
        for (auto const& element : arr) {
            if (element.is_object()) {
                for (auto const& [field, _] : element.as_object())
                    fields.emplace(field.data(), field.size());
            }
        }

        if (fields.empty()) {
            jsonObject_[arrayPrefix] = arr;
            continue;
        }

        for (auto const& field : fields) {
            boost::json::array column;
            column.reserve(arr.size());
            for (auto const& element : arr) {
                if (element.is_object() and element.as_object().contains(field)) {
                    column.push_back(element.as_object().at(field));
                } else {
                    column.emplace_back(nullptr);
                }
            }
            jsonObject_[fmt::format("{}.{}", arrayPrefix, field)] = std::move(column);
        }
    }
}

}  // namespace util::config
