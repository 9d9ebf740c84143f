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

#include "data/BroadcastLedger.hpp"
#include "data/Errors.hpp"
#include "data/Types.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockDocumentStore.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

using namespace data;
using testing::HasSubstr;

struct BroadcastLedgerTests : NoLoggerFixture {
    std::shared_ptr<InMemoryDocumentStore> store = std::make_shared<InMemoryDocumentStore>();
    BroadcastLedger ledger{store};

    void
    expectCorrupt(std::string const& content, std::string const& messagePart)
    {
        store->content = content;
        auto const err = ledger.load();
        ASSERT_TRUE(err.has_value()) << content;
        EXPECT_EQ(err->kind, StoreError::Kind::CorruptLedger) << content;
        EXPECT_THAT(err->message, HasSubstr(messagePart)) << content;
    }
};

TEST_F(BroadcastLedgerTests, AbsentDocumentIsEmpty)
{
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_EQ(ledger.size(), 0);
    EXPECT_FALSE(ledger.isDirty());
}

TEST_F(BroadcastLedgerTests, BlankDocumentIsEmpty)
{
    store->content = "\n";
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_EQ(ledger.size(), 0);
}

TEST_F(BroadcastLedgerTests, DocumentWithoutRecordsIsEmpty)
{
    store->content = "{}";
    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_EQ(ledger.size(), 0);
}

TEST_F(BroadcastLedgerTests, LoadsRecords)
{
    store->content = R"JSON({"broadcasted": {
        "aaa": {"hash": "0x111", "ts": 1700000000},
        "bbb": {"hash": "0x222", "ts": 1700000100}
    }})JSON";

    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_EQ(ledger.size(), 2);
    EXPECT_TRUE(ledger.contains("aaa"));
    EXPECT_TRUE(ledger.contains("bbb"));
    EXPECT_FALSE(ledger.contains("ccc"));
    EXPECT_EQ(
        ledger.find("bbb"),
        (BroadcastRecord{.fingerprint = "bbb", .txHash = "0x222", .broadcastAtUnixSeconds = 1700000100})
    );
    EXPECT_EQ(ledger.find("ccc"), std::nullopt);
    EXPECT_FALSE(ledger.isDirty());
}

TEST_F(BroadcastLedgerTests, CorruptDocuments)
{
    expectCorrupt("{\"broadcasted\":", "not valid JSON");
    expectCorrupt("[]", "must hold a JSON object");
    expectCorrupt(R"({"broadcasted": []})", "'broadcasted' must be an object");
    expectCorrupt(R"({"broadcasted": {"aaa": "0x111"}})", "record aaa is not an object");
    expectCorrupt(R"({"broadcasted": {"aaa": {"ts": 1}}})", "record aaa has no string 'hash'");
    expectCorrupt(R"({"broadcasted": {"aaa": {"hash": "0x1", "ts": "now"}}})", "non integer 'ts'");
}

TEST_F(BroadcastLedgerTests, RecordIsAppendOnly)
{
    EXPECT_TRUE(ledger.record("aaa", "0x111", 10));
    EXPECT_TRUE(ledger.isDirty());

    EXPECT_FALSE(ledger.record("aaa", "0x999", 20));
    EXPECT_EQ(ledger.size(), 1);
    EXPECT_EQ(ledger.find("aaa")->txHash, "0x111");
    EXPECT_EQ(ledger.find("aaa")->broadcastAtUnixSeconds, 10);
}

TEST_F(BroadcastLedgerTests, SaveThenLoad)
{
    ledger.record("aaa", "0x111", 10);
    ledger.record("bbb", "0x222", 20);

    EXPECT_FALSE(ledger.save().has_value());
    EXPECT_FALSE(ledger.isDirty());
    EXPECT_EQ(store->content, R"({"broadcasted":{"aaa":{"hash":"0x111","ts":10},"bbb":{"hash":"0x222","ts":20}}})");

    BroadcastLedger reloaded{store};
    EXPECT_FALSE(reloaded.load().has_value());
    EXPECT_EQ(reloaded.size(), 2);
    EXPECT_EQ(reloaded.find("aaa"), ledger.find("aaa"));
}

TEST_F(BroadcastLedgerTests, SaveFailureKeepsRecordsDirty)
{
    ledger.record("aaa", "0x111", 10);
    store->failWrites = true;

    auto const err = ledger.save();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, StoreError::Kind::PersistenceWriteError);
    EXPECT_TRUE(ledger.isDirty());
    EXPECT_TRUE(ledger.contains("aaa"));
    EXPECT_FALSE(store->content.has_value());
}

TEST_F(BroadcastLedgerTests, LoadReplacesRecords)
{
    ledger.record("zzz", "0x0", 1);
    store->content = R"({"broadcasted": {"aaa": {"hash": "0x111", "ts": 1}}})";

    EXPECT_FALSE(ledger.load().has_value());
    EXPECT_FALSE(ledger.contains("zzz"));
    EXPECT_TRUE(ledger.contains("aaa"));
    EXPECT_FALSE(ledger.isDirty());
}
