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

#include "util/config/ArrayView.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ObjectView.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace util::config {

ObjectView
ArrayView::Iterator::operator*() const
{
    return view_->objectAt(index_);
}

ArrayView::ArrayView(std::string_view prefix, SentinelConfigDefinition const& configDef)
    : prefix_{prefix}, configDef_{configDef}
{
}

std::size_t
ArrayView::size() const
{
    return configDef_.get().arraySize(prefix_);
}

ObjectView
ArrayView::objectAt(std::size_t idx) const
{
    ASSERT(idx < size(), "Object index {} is out of scope of array {}", idx, prefix_);
    return ObjectView{prefix_, idx, configDef_.get()};
}

ArrayView::Iterator
ArrayView::begin() const
{
    return Iterator{this, 0};
}

ArrayView::Iterator
ArrayView::end() const
{
    return Iterator{this, size()};
}

}  // namespace util::config
