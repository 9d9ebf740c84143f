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

#include <array>
#include <cstddef>
#include <ostream>
#include <string>

namespace scheduler {

/**
 * @brief The state of a queued item within one scheduler cycle, it provides the helper to convert the state to string
 *
 * Pending -> Evaluating -> (Fired | Waiting | Skipped). Waiting becomes Pending again on the next cycle; Fired and
 * Skipped items leave the queue.
 */
class ItemState {
public:
    /**
     * @brief The state of an item
     */
    enum State { Pending, Evaluating, Fired, Waiting, Skipped, NumStates };

    /**
     * @brief Construct a new ItemState object with the given state
     *
     * @param state The state
     */
    ItemState(State state) : state_(state)
    {
    }

    /**
     * @brief Compare the state with another ItemState
     *
     * @param other The other state to compare
     * @return true if the states are equal, false otherwise
     */
    bool
    operator==(ItemState const& other) const;

    /**
     * @brief Compare the state with a raw state
     * @param other The other state to compare
     * @return true if the states are equal, false otherwise
     */
    bool
    operator==(State const& other) const;

    /**
     * @brief Whether the item leaves the queue in this state
     *
     * @return true for Fired and Skipped
     */
    [[nodiscard]] bool
    isTerminal() const;

    /**
     * @brief Convert the state to string
     *
     * @return The string representation of the state
     */
    [[nodiscard]] std::string
    toString() const;

    friend std::ostream&
    operator<<(std::ostream& stream, ItemState const& state)
    {
        return stream << state.toString();
    }

private:
    static constexpr std::array<char const*, static_cast<size_t>(NumStates)> kSTATE_STR_MAP = {
        "Pending",
        "Evaluating",
        "Fired",
        "Waiting",
        "Skipped"
    };

    State state_;
};

}  // namespace scheduler
