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

#include "util/config/ObjectView.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>

namespace util::config {

class SentinelConfigDefinition;

/**
 * @brief View for an array of objects in the config, iterable as a range of ObjectView
 */
class ArrayView {
public:
    /**
     * @brief Forward iterator yielding an ObjectView per array element
     */
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ObjectView;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ObjectView;

        Iterator() = default;

        /**
         * @brief Constructs an iterator at the given position
         *
         * @param view The array view being iterated
         * @param index The element position
         */
        Iterator(ArrayView const* view, std::size_t index) : view_{view}, index_{index}
        {
        }

        [[nodiscard]] ObjectView
        operator*() const;

        Iterator&
        operator++()
        {
            ++index_;
            return *this;
        }

        Iterator
        operator++(int)
        {
            auto copy = *this;
            ++index_;
            return copy;
        }

        [[nodiscard]] bool
        operator==(Iterator const& other) const = default;

    private:
        ArrayView const* view_ = nullptr;
        std::size_t index_ = 0;
    };

    /**
     * @brief Constructs a view over the array of objects with the given prefix
     *
     * @param prefix The key prefix, i.e. "log_channels"
     * @param configDef The config definition holding the values
     */
    ArrayView(std::string_view prefix, SentinelConfigDefinition const& configDef);

    /**
     * @brief Returns the number of elements in the array
     *
     * @return Number of elements
     */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @brief Returns a view into the element at the given index
     *
     * @param idx The element index
     * @return ObjectView for the element
     */
    [[nodiscard]] ObjectView
    objectAt(std::size_t idx) const;

    [[nodiscard]] Iterator
    begin() const;

    [[nodiscard]] Iterator
    end() const;

private:
    std::string prefix_;
    std::reference_wrapper<SentinelConfigDefinition const> configDef_;
};

}  // namespace util::config
