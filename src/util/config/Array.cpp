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

#include "util/config/Array.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace util::config {

std::optional<Error>
Array::addValue(Value value, std::optional<std::string_view> key)
{
    auto newElem = itemPattern_;
    if (auto const maybeError = newElem.setValue(std::move(value), key); maybeError.has_value())
        return maybeError;

    elements_.emplace_back(std::move(newElem));
    return std::nullopt;
}

std::optional<Error>
Array::addMissing(std::string_view key)
{
    if (not itemPattern_.isOptional() and not itemPattern_.hasValue())
        return Error{key, fmt::format("is required for element {}", elements_.size())};

    elements_.push_back(itemPattern_);
    return std::nullopt;
}

size_t
Array::size() const
{
    return elements_.size();
}

ConfigValue const&
Array::at(std::size_t idx) const
{
    ASSERT(idx < elements_.size(), "Index is out of scope");
    return elements_[idx];
}

ConfigValue const&
Array::getArrayPattern() const
{
    return itemPattern_;
}

}  // namespace util::config
