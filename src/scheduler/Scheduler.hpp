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

#include "chain/ChainRegistry.hpp"
#include "data/BroadcastLedger.hpp"
#include "data/PersistentQueue.hpp"
#include "data/Types.hpp"
#include "scheduler/ItemState.hpp"
#include "scheduler/Settings.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace scheduler {

/**
 * @brief Outcome of one pass over the queue
 */
struct CycleReport {
    std::size_t fired = 0;
    std::size_t waiting = 0;
    std::size_t skipped = 0;
    std::size_t pending = 0;  ///< items left untouched because of an error or an unknown chain

    bool
    operator==(CycleReport const&) const = default;
};

/**
 * @brief The firing state machine
 *
 * Owns the only mutable list of queued items. Each cycle evaluates the items in queue order against the base fee of
 * their chain, broadcasts the ones under their threshold and moves them from the queue to the ledger.
 *
 * The queue document is never written while the ledger has unsaved records, so a crash can't lose track of a
 * broadcast transaction. Failed saves are retried at every later write opportunity and at the end of every cycle.
 */
class Scheduler {
public:
    /** @brief Returns the current time as unix seconds */
    using ClockType = std::function<std::int64_t()>;

private:
    util::Logger log_{"Scheduler"};
    Settings settings_;
    chain::ChainRegistry registry_;
    data::PersistentQueue queue_;
    data::BroadcastLedger ledger_;
    std::vector<data::QueueItem> items_;
    ClockType clock_;
    bool queueDirty_ = false;
    bool attemptsUnsaved_ = false;  ///< attempts changed since the last queue save, below the save interval

public:
    /**
     * @brief Construct a new Scheduler
     *
     * @param settings The scheduler settings
     * @param registry The configured chains
     * @param queue The queue document the items are saved to
     * @param ledger The loaded ledger
     * @param items The items loaded from the queue
     * @param clock Source of broadcast timestamps
     */
    Scheduler(
        Settings settings,
        chain::ChainRegistry registry,
        data::PersistentQueue queue,
        data::BroadcastLedger ledger,
        std::vector<data::QueueItem> items,
        ClockType clock = systemClock
    );

    /**
     * @brief Drop items that are already in the ledger, without broadcasting them
     *
     * Needed after a restart that happened between a broadcast and the following queue save.
     *
     * @return Number of dropped items
     */
    std::size_t
    reconcile();

    /**
     * @brief Evaluate every queued item once
     *
     * @return What happened to the items
     */
    CycleReport
    runCycle();

    /**
     * @brief Save whatever is not saved yet, ledger first. Attempt counters are saved too.
     *
     * @return true if nothing is left unsaved
     */
    bool
    flush();

    /**
     * @brief Delay before the next cycle: the poll interval plus a uniformly random jitter
     *
     * @return The delay
     */
    [[nodiscard]] std::chrono::steady_clock::duration
    nextDelay() const;

    /**
     * @return The items still queued, in order
     */
    [[nodiscard]] std::vector<data::QueueItem> const&
    items() const;

    /**
     * @return The broadcast ledger
     */
    [[nodiscard]] data::BroadcastLedger const&
    ledger() const;

    /**
     * @return true if the queue or the ledger has unsaved changes
     */
    [[nodiscard]] bool
    hasUnsavedChanges() const;

    /**
     * @brief The wall clock
     *
     * @return Current unix time in seconds
     */
    static std::int64_t
    systemClock();

private:
    ItemState
    evaluate(data::QueueItem& item);

    void
    persist();
};

}  // namespace scheduler
