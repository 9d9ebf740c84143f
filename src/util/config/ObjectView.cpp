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

#include "util/config/ObjectView.hpp"

#include "util/config/ConfigDefinition.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace util::config {

ObjectView::ObjectView(std::string_view prefix, std::size_t arrayIndex, SentinelConfigDefinition const& configDef)
    : prefix_{prefix}, arrayIndex_{arrayIndex}, configDef_{configDef}
{
}

bool
ObjectView::containsKey(std::string_view key) const
{
    return configDef_.get().contains(getFullKey(key));
}

std::string
ObjectView::getFullKey(std::string_view key) const
{
    return fmt::format("{}.[].{}", prefix_, key);
}

}  // namespace util::config
