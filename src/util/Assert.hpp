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

#include "util/SourceLocation.hpp"

#include <fmt/core.h>

#include <functional>
#include <string_view>
#include <utility>

namespace util::impl {

/**
 * @brief The action taken when an assertion fails.
 *
 * By default the message is logged as fatal (or printed to stderr if logging is disabled) and the process exits.
 * Tests may replace the action to turn failed assertions into exceptions.
 */
class OnAssert {
public:
    using ActionType = std::function<void(std::string_view)>;

private:
    static ActionType action;

public:
    static void
    call(std::string_view message);

    static void
    setAction(ActionType newAction);

    static void
    resetAction();

private:
    static void
    defaultAction(std::string_view message);
};

template <typename... Args>
constexpr void
assertImpl(
    SourceLocationType const location,
    char const* expression,
    bool const condition,
    fmt::format_string<Args...> format,
    Args&&... args
)
{
    if (!condition) {
        auto const resultMessage = fmt::format(
            "Assertion '{}' failed at {}:{}:\n{}",
            expression,
            location.file_name(),
            location.line(),
            fmt::format(format, std::forward<Args>(args)...)
        );
        OnAssert::call(resultMessage);
    }
}

}  // namespace util::impl

#define ASSERT(condition, ...) \
    util::impl::assertImpl(CURRENT_SRC_LOCATION, #condition, static_cast<bool>(condition), __VA_ARGS__)
