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

#include "scheduler/Scheduler.hpp"

#include "chain/ChainRegistry.hpp"
#include "data/BroadcastLedger.hpp"
#include "data/Fingerprint.hpp"
#include "data/PersistentQueue.hpp"
#include "data/Types.hpp"
#include "scheduler/FirePolicy.hpp"
#include "scheduler/ItemState.hpp"
#include "scheduler/Settings.hpp"
#include "util/Assert.hpp"
#include "util/Random.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <utility>
#include <vector>

namespace scheduler {

Scheduler::Scheduler(
    Settings settings,
    chain::ChainRegistry registry,
    data::PersistentQueue queue,
    data::BroadcastLedger ledger,
    std::vector<data::QueueItem> items,
    ClockType clock
)
    : settings_{std::move(settings)}
    , registry_{std::move(registry)}
    , queue_{std::move(queue)}
    , ledger_{std::move(ledger)}
    , items_{std::move(items)}
    , clock_{std::move(clock)}
{
    ASSERT(settings_.queueSaveInterval > 0, "Queue save interval must be positive");
}

std::size_t
Scheduler::reconcile()
{
    auto const removed = std::erase_if(items_, [this](data::QueueItem const& item) {
        if (not ledger_.contains(data::fingerprint(item.chain, item.rawTx)))
            return false;

        LOG(log_.info()) << "Dropping " << item.label << " on " << item.chain << ": already broadcast";
        return true;
    });

    if (removed > 0) {
        queueDirty_ = true;
        persist();
    }

    LOG(log_.info()) << "Reconciled queue: " << removed << " already broadcast, " << items_.size() << " pending";
    return removed;
}

CycleReport
Scheduler::runCycle()
{
    CycleReport report;

    for (auto it = items_.begin(); it != items_.end();) {
        auto state = ItemState{ItemState::Pending};
        try {
            state = evaluate(*it);
        } catch (std::exception const& e) {
            LOG(log_.error()) << "ERR " << it->label << " on " << it->chain << ": " << e.what();
        }

        LOG(log_.trace()) << it->label << " on " << it->chain << " -> " << state;

        if (state.isTerminal()) {
            if (state == ItemState::Fired) {
                ++report.fired;
            } else {
                ++report.skipped;
            }

            it = items_.erase(it);
            queueDirty_ = true;
            persist();
            continue;
        }

        if (state == ItemState::Waiting) {
            ++report.waiting;
            if (it->attempts % settings_.queueSaveInterval == 0) {
                queueDirty_ = true;
                persist();
            } else {
                attemptsUnsaved_ = true;
            }
        } else {
            ++report.pending;
        }
        ++it;
    }

    persist();

    LOG(log_.debug()) << "Cycle done: fired=" << report.fired << " waiting=" << report.waiting
                      << " skipped=" << report.skipped << " pending=" << report.pending
                      << " queued=" << items_.size();
    return report;
}

bool
Scheduler::flush()
{
    if (attemptsUnsaved_)
        queueDirty_ = true;

    persist();
    return not hasUnsavedChanges();
}

std::chrono::steady_clock::duration
Scheduler::nextDelay() const
{
    auto const jitter = util::Random::uniform(0, static_cast<std::uint64_t>(settings_.jitter.count()));
    return settings_.pollInterval + std::chrono::seconds{jitter};
}

std::vector<data::QueueItem> const&
Scheduler::items() const
{
    return items_;
}

data::BroadcastLedger const&
Scheduler::ledger() const
{
    return ledger_;
}

bool
Scheduler::hasUnsavedChanges() const
{
    return queueDirty_ or attemptsUnsaved_ or ledger_.isDirty();
}

std::int64_t
Scheduler::systemClock()
{
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

ItemState
Scheduler::evaluate(data::QueueItem& item)
{
    LOG(log_.trace()) << item.label << " on " << item.chain << " -> " << ItemState{ItemState::Evaluating};

    auto const fingerprint = data::fingerprint(item.chain, item.rawTx);
    if (ledger_.contains(fingerprint)) {
        LOG(log_.info()) << "SKIP " << item.label << " on " << item.chain << ": already broadcast";
        return ItemState::Skipped;
    }

    auto* oracle = registry_.find(item.chain);
    if (oracle == nullptr) {
        LOG(log_.warn()) << "Item " << item.label << " references unknown chain " << item.chain;
        return ItemState::Pending;
    }

    auto const baseFee = oracle->currentBaseFeeGwei();
    if (not baseFee.has_value()) {
        LOG(log_.error()) << "ERR " << item.label << " on " << item.chain << ": " << baseFee.error();
        return ItemState::Pending;
    }

    auto const fire = shouldFire(*baseFee, item.minBaseFeeGwei, settings_.maxFeeGwei);
    LOG(log_.info()) << item.chain << " basefee=" << *baseFee << " gwei label=" << item.label
                     << " min=" << item.minBaseFeeGwei << " max=" << settings_.maxFeeGwei << " -> "
                     << (fire ? "OK" : "WAIT");

    if (not fire) {
        ++item.attempts;
        return ItemState::Waiting;
    }

    auto const txHash = oracle->broadcastRaw(item.rawTx);
    if (not txHash.has_value()) {
        LOG(log_.error()) << "ERR " << item.label << " on " << item.chain << ": " << txHash.error();
        return ItemState::Pending;
    }

    ledger_.record(fingerprint, *txHash, clock_());
    LOG(log_.info()) << "OK broadcast " << item.label << " on " << item.chain << ": " << *txHash;
    return ItemState::Fired;
}

void
Scheduler::persist()
{
    if (ledger_.isDirty()) {
        if (auto const err = ledger_.save(); err.has_value()) {
            LOG(log_.error()) << "Ledger is not saved, queue save deferred: " << *err;
            return;
        }
    }

    if (queueDirty_) {
        if (auto const err = queue_.save(items_); err.has_value()) {
            LOG(log_.error()) << "Queue is not saved, will retry: " << *err;
            return;
        }
        queueDirty_ = false;
        attemptsUnsaved_ = false;
    }
}

}  // namespace scheduler
