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

#include "util/config/ConfigConstraints.hpp"

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace util::config {

std::optional<Error>
NonEmptyString::checkTypeImpl(Value const& val) const
{
    if (!std::holds_alternative<std::string>(val))
        return Error{"Value must be a string"};
    return std::nullopt;
}

std::optional<Error>
NonEmptyString::checkValueImpl(Value const& val) const
{
    if (std::get<std::string>(val).empty())
        return Error{"Value must not be empty"};
    return std::nullopt;
}

std::optional<Error>
ValidateUrl::checkTypeImpl(Value const& val) const
{
    if (!std::holds_alternative<std::string>(val))
        return Error{"URL must be a string"};
    return std::nullopt;
}

std::optional<Error>
ValidateUrl::checkValueImpl(Value const& val) const
{
    auto const& url = std::get<std::string>(val);
    for (std::string_view const scheme : {"http://", "https://"}) {
        if (boost::istarts_with(url, scheme) and url.size() > scheme.size())
            return std::nullopt;
    }
    return Error{"URL must start with http:// or https:// and name a host"};
}

}  // namespace util::config
