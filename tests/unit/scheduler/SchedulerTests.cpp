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

#include "chain/ChainRegistry.hpp"
#include "chain/Errors.hpp"
#include "data/BroadcastLedger.hpp"
#include "data/Fingerprint.hpp"
#include "data/PersistentQueue.hpp"
#include "data/Types.hpp"
#include "scheduler/Scheduler.hpp"
#include "scheduler/Settings.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockChainOracle.hpp"
#include "util/MockDocumentStore.hpp"

#include <fmt/core.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace scheduler;
using data::QueueItem;
using testing::HasSubstr;
using testing::Return;

namespace {

constexpr std::int64_t kNOW = 1'700'000'000;
constexpr auto kSAVE_INTERVAL = 3;

MockChainOracleImpl::BaseFeeReturnType
fee(std::uint64_t gwei)
{
    return gwei;
}

MockChainOracleImpl::BaseFeeReturnType
unavailable(std::string message)
{
    return std::unexpected{chain::OracleError{chain::OracleError::Kind::Unavailable, std::move(message)}};
}

QueueItem
makeItem(std::string chain, std::string rawTx, std::string label, std::uint64_t minFee, std::uint64_t attempts = 0)
{
    return QueueItem{
        .chain = std::move(chain),
        .rawTx = std::move(rawTx),
        .label = std::move(label),
        .minBaseFeeGwei = minFee,
        .attempts = attempts
    };
}

}  // namespace

struct SchedulerTests : LoggerFixture {
    std::shared_ptr<StrictMockChainOracle> ethereum = std::make_shared<StrictMockChainOracle>();
    std::shared_ptr<StrictMockChainOracle> base = std::make_shared<StrictMockChainOracle>();
    std::shared_ptr<InMemoryDocumentStore> queueStore = std::make_shared<InMemoryDocumentStore>();
    std::shared_ptr<InMemoryDocumentStore> ledgerStore = std::make_shared<InMemoryDocumentStore>();

    Settings settings{
        .maxFeeGwei = 18,
        .pollInterval = std::chrono::seconds{15},
        .jitter = std::chrono::seconds{5},
        .queueSaveInterval = kSAVE_INTERVAL
    };

    std::unique_ptr<Scheduler>
    makeScheduler(std::vector<QueueItem> items)
    {
        data::BroadcastLedger ledger{ledgerStore};
        EXPECT_FALSE(ledger.load().has_value());

        auto registry = chain::ChainRegistry::make({{"ethereum", ethereum}, {"base", base}});
        EXPECT_TRUE(registry.has_value());

        return std::make_unique<Scheduler>(
            settings,
            std::move(registry).value(),
            data::PersistentQueue{queueStore, settings.maxFeeGwei},
            std::move(ledger),
            std::move(items),
            [] { return kNOW; }
        );
    }

    std::vector<QueueItem>
    savedQueue() const
    {
        auto const items = data::PersistentQueue{queueStore, 0}.load();
        EXPECT_TRUE(items.has_value());
        return items.value_or(std::vector<QueueItem>{});
    }

    data::BroadcastLedger
    savedLedger() const
    {
        data::BroadcastLedger ledger{ledgerStore};
        EXPECT_FALSE(ledger.load().has_value());
        return ledger;
    }
};

TEST_F(SchedulerTests, FiresWhenBaseFeeIsUnderBothThresholds)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(14)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xhash"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1}));

    auto const log = getLoggerString();
    EXPECT_THAT(log, HasSubstr("ethereum basefee=14 gwei label=payroll min=14 max=18 -> OK"));
    EXPECT_THAT(log, HasSubstr("OK broadcast payroll on ethereum: 0xhash"));

    EXPECT_TRUE(scheduler->items().empty());
    EXPECT_FALSE(scheduler->hasUnsavedChanges());

    auto const fingerprint = data::fingerprint("ethereum", "0x01");
    EXPECT_EQ(
        savedLedger().find(fingerprint),
        (data::BroadcastRecord{.fingerprint = fingerprint, .txHash = "0xhash", .broadcastAtUnixSeconds = kNOW})
    );
    EXPECT_TRUE(savedQueue().empty());
}

TEST_F(SchedulerTests, WaitsAboveItemThreshold)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(15)));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.waiting = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("ethereum basefee=15 gwei label=payroll min=14 max=18 -> WAIT"));

    ASSERT_EQ(scheduler->items().size(), 1);
    EXPECT_EQ(scheduler->items().front().attempts, 1);
    EXPECT_EQ(scheduler->ledger().size(), 0);
    EXPECT_FALSE(queueStore->content.has_value());
}

TEST_F(SchedulerTests, GlobalCeilingCannotBeLoosenedPerItem)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "generous", 20)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(19)));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.waiting = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("-> WAIT"));
}

TEST_F(SchedulerTests, QueueIsSavedEveryNthAttempt)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillRepeatedly(Return(fee(30)));

    for (auto i = 1; i < kSAVE_INTERVAL; ++i) {
        scheduler->runCycle();
        EXPECT_FALSE(queueStore->content.has_value());
    }

    scheduler->runCycle();
    ASSERT_TRUE(queueStore->content.has_value());
    EXPECT_EQ(savedQueue(), (std::vector<QueueItem>{makeItem("ethereum", "0x01", "payroll", 14, kSAVE_INTERVAL)}));
}

TEST_F(SchedulerTests, AttemptsContinueFromLoadedValue)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14, kSAVE_INTERVAL - 1)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(30)));

    scheduler->runCycle();
    EXPECT_EQ(scheduler->items().front().attempts, kSAVE_INTERVAL);
    EXPECT_TRUE(queueStore->content.has_value());
}

TEST_F(SchedulerTests, OracleErrorLeavesItemPending)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(unavailable("ethereum: timed out")));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.pending = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("ERR payroll on ethereum: OracleUnavailable: ethereum: timed out"));

    ASSERT_EQ(scheduler->items().size(), 1);
    EXPECT_EQ(scheduler->items().front().attempts, 0);
}

TEST_F(SchedulerTests, RejectedBroadcastIsRetriedNextCycle)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).Times(2).WillRepeatedly(Return(fee(10)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01"))
        .WillOnce(Return(std::unexpected{
            chain::OracleError{chain::OracleError::Kind::BroadcastRejected, "ethereum: replacement underpriced"}
        }))
        .WillOnce(Return("0xhash"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.pending = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("ERR payroll on ethereum: BroadcastRejected"));
    EXPECT_EQ(scheduler->items().size(), 1);
    EXPECT_EQ(scheduler->items().front().attempts, 0);
    EXPECT_EQ(scheduler->ledger().size(), 0);

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1}));
    EXPECT_TRUE(scheduler->items().empty());
    EXPECT_EQ(scheduler->ledger().size(), 1);
}

TEST_F(SchedulerTests, UnknownChainStaysPending)
{
    auto scheduler = makeScheduler({makeItem("polygon", "0x01", "bridge", 14)});

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.pending = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("Scheduler:WRN Item bridge references unknown chain polygon"));

    ASSERT_EQ(scheduler->items().size(), 1);
    EXPECT_EQ(scheduler->items().front().attempts, 0);
}

TEST_F(SchedulerTests, ExceptionIsContainedToTheItem)
{
    auto scheduler = makeScheduler(
        {makeItem("ethereum", "0x01", "first", 14), makeItem("base", "0x02", "second", 14)}
    );

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(testing::Throw(std::runtime_error{"boom"}));
    EXPECT_CALL(*base, currentBaseFeeGwei).WillOnce(Return(fee(1)));
    EXPECT_CALL(*base, broadcastRaw("0x02")).WillOnce(Return("0xhash"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1, .pending = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("ERR first on ethereum: boom"));
    EXPECT_EQ(scheduler->items(), (std::vector<QueueItem>{makeItem("ethereum", "0x01", "first", 14)}));
}

TEST_F(SchedulerTests, ItemsAreEvaluatedInQueueOrder)
{
    auto scheduler = makeScheduler(
        {makeItem("base", "0x01", "a", 5), makeItem("ethereum", "0x02", "b", 5), makeItem("base", "0x03", "c", 5)}
    );

    testing::InSequence const seq;
    EXPECT_CALL(*base, currentBaseFeeGwei).WillOnce(Return(fee(9)));
    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(1)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x02")).WillOnce(Return("0xb"));
    EXPECT_CALL(*base, currentBaseFeeGwei).WillOnce(Return(fee(9)));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1, .waiting = 2}));
    ASSERT_EQ(scheduler->items().size(), 2);
    EXPECT_EQ(scheduler->items()[0].label, "a");
    EXPECT_EQ(scheduler->items()[1].label, "c");
}

TEST_F(SchedulerTests, DuplicateItemIsBroadcastOnce)
{
    auto scheduler = makeScheduler(
        {makeItem("ethereum", "0x01", "original", 14), makeItem("ethereum", "0x01", "copy", 16)}
    );

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(10)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xhash"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1, .skipped = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("SKIP copy on ethereum: already broadcast"));
    EXPECT_TRUE(scheduler->items().empty());
    EXPECT_EQ(scheduler->ledger().size(), 1);
}

TEST_F(SchedulerTests, SameTransactionOnAnotherChainIsNotADuplicate)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "a", 14), makeItem("base", "0x01", "b", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(1)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xeth"));
    EXPECT_CALL(*base, currentBaseFeeGwei).WillOnce(Return(fee(1)));
    EXPECT_CALL(*base, broadcastRaw("0x01")).WillOnce(Return("0xbase"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 2}));
    EXPECT_EQ(savedLedger().size(), 2);
}

TEST_F(SchedulerTests, ItemAlreadyInLedgerIsSkippedWithoutOracleCalls)
{
    ledgerStore->content = fmt::format(
        R"({{"broadcasted":{{"{}":{{"hash":"0xold","ts":1}}}}}})", data::fingerprint("ethereum", "0x01")
    );
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.skipped = 1}));
    EXPECT_TRUE(scheduler->items().empty());
    EXPECT_TRUE(savedQueue().empty());
    EXPECT_EQ(savedLedger().find(data::fingerprint("ethereum", "0x01"))->txHash, "0xold");
}

TEST_F(SchedulerTests, ReconcileDropsItemsAlreadyBroadcast)
{
    ledgerStore->content = fmt::format(
        R"({{"broadcasted":{{"{}":{{"hash":"0xold","ts":1}}}}}})", data::fingerprint("ethereum", "0x01")
    );
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "sent", 14), makeItem("ethereum", "0x02", "new", 14)});

    EXPECT_EQ(scheduler->reconcile(), 1);
    EXPECT_EQ(scheduler->items(), (std::vector<QueueItem>{makeItem("ethereum", "0x02", "new", 14)}));
    EXPECT_EQ(savedQueue(), scheduler->items());
    EXPECT_FALSE(scheduler->hasUnsavedChanges());
}

TEST_F(SchedulerTests, ReconcileWithNothingToDropDoesNotWrite)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "new", 14)});

    EXPECT_EQ(scheduler->reconcile(), 0);
    EXPECT_FALSE(queueStore->content.has_value());
    EXPECT_FALSE(ledgerStore->content.has_value());
}

TEST_F(SchedulerTests, RestartAfterBroadcastDoesNotBroadcastAgain)
{
    queueStore->content = R"([{"chain":"ethereum","rawTx":"0x01","label":"payroll","minBaseFeeGwei":14}])";
    queueStore->failWrites = true;
    {
        auto const items = data::PersistentQueue{queueStore, 18}.load();
        ASSERT_TRUE(items.has_value());
        auto scheduler = makeScheduler(*items);

        EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(10)));
        EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xhash"));
        scheduler->runCycle();
        EXPECT_TRUE(scheduler->hasUnsavedChanges());
    }

    // the process died with the old queue document on disk
    queueStore->failWrites = false;
    auto const items = data::PersistentQueue{queueStore, 18}.load();
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 1);

    auto scheduler = makeScheduler(*items);
    EXPECT_EQ(scheduler->reconcile(), 1);
    EXPECT_EQ(scheduler->runCycle(), CycleReport{});
    EXPECT_TRUE(savedQueue().empty());
}

TEST_F(SchedulerTests, QueueIsNotSavedBeforeTheLedger)
{
    queueStore->content = "untouched";
    ledgerStore->failWrites = true;
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(10)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xhash"));

    EXPECT_EQ(scheduler->runCycle(), (CycleReport{.fired = 1}));
    EXPECT_THAT(getLoggerString(), HasSubstr("Ledger is not saved, queue save deferred"));
    EXPECT_EQ(queueStore->content, "untouched");
    EXPECT_TRUE(scheduler->hasUnsavedChanges());
    EXPECT_FALSE(scheduler->flush());

    ledgerStore->failWrites = false;
    EXPECT_TRUE(scheduler->flush());
    EXPECT_FALSE(scheduler->hasUnsavedChanges());
    EXPECT_TRUE(savedLedger().contains(data::fingerprint("ethereum", "0x01")));
    EXPECT_TRUE(savedQueue().empty());
}

TEST_F(SchedulerTests, FailedQueueSaveIsRetriedAtTheEndOfNextCycle)
{
    queueStore->failWrites = true;
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});

    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(10)));
    EXPECT_CALL(*ethereum, broadcastRaw("0x01")).WillOnce(Return("0xhash"));

    scheduler->runCycle();
    EXPECT_TRUE(ledgerStore->content.has_value());
    EXPECT_FALSE(queueStore->content.has_value());
    EXPECT_TRUE(scheduler->hasUnsavedChanges());

    queueStore->failWrites = false;
    EXPECT_EQ(scheduler->runCycle(), CycleReport{});
    EXPECT_EQ(queueStore->content, "[]");
    EXPECT_FALSE(scheduler->hasUnsavedChanges());
}

TEST_F(SchedulerTests, FlushSavesAttemptsBelowTheInterval)
{
    auto scheduler = makeScheduler({makeItem("ethereum", "0x01", "payroll", 14)});
    EXPECT_CALL(*ethereum, currentBaseFeeGwei).WillOnce(Return(fee(30)));

    scheduler->runCycle();
    EXPECT_FALSE(queueStore->content.has_value());
    EXPECT_TRUE(scheduler->hasUnsavedChanges());

    EXPECT_TRUE(scheduler->flush());
    EXPECT_FALSE(scheduler->hasUnsavedChanges());
    EXPECT_EQ(savedQueue(), (std::vector<QueueItem>{makeItem("ethereum", "0x01", "payroll", 14, 1)}));
}

TEST_F(SchedulerTests, NextDelayIsPollIntervalPlusJitter)
{
    auto scheduler = makeScheduler({});
    for (auto i = 0; i < 100; ++i) {
        auto const delay = scheduler->nextDelay();
        EXPECT_GE(delay, std::chrono::seconds{15});
        EXPECT_LE(delay, std::chrono::seconds{20});
    }
}

TEST_F(SchedulerTests, NextDelayWithoutJitter)
{
    settings.jitter = std::chrono::seconds{0};
    auto scheduler = makeScheduler({});
    EXPECT_EQ(scheduler->nextDelay(), std::chrono::seconds{15});
}

TEST_F(SchedulerTests, EmptyQueue)
{
    auto scheduler = makeScheduler({});
    EXPECT_EQ(scheduler->runCycle(), CycleReport{});
    EXPECT_FALSE(queueStore->content.has_value());
    EXPECT_FALSE(ledgerStore->content.has_value());
}
