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

#include "data/DocumentStoreInterface.hpp"
#include "data/Errors.hpp"
#include "data/Types.hpp"
#include "util/log/Logger.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace data {

/**
 * @brief Durable, append-only record of broadcast transactions keyed by fingerprint
 *
 * The document has the form `{"broadcasted": {"<fingerprint>": {"hash": "<txHash>", "ts": <unix seconds>}}}`.
 * Records are never overwritten nor removed.
 */
class BroadcastLedger {
    util::Logger log_{"Ledger"};
    std::shared_ptr<DocumentStoreInterface> store_;
    std::map<std::string, BroadcastRecord> records_;
    bool dirty_ = false;

public:
    /**
     * @brief Construct a new, empty BroadcastLedger
     *
     * @param store The document holding the ledger
     */
    explicit BroadcastLedger(std::shared_ptr<DocumentStoreInterface> store);

    /**
     * @brief Replace the in-memory records with the content of the document
     *
     * A missing or blank document is an empty ledger.
     *
     * @return CorruptLedger if the document is malformed, ReadError if it can't be read, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<StoreError>
    load();

    /**
     * @brief Whether a transaction with the given fingerprint has been broadcast
     *
     * @param fingerprint The fingerprint
     * @return true if recorded, false otherwise
     */
    [[nodiscard]] bool
    contains(std::string const& fingerprint) const;

    /**
     * @brief Record a successful broadcast. Existing records are left untouched.
     *
     * @param fingerprint The fingerprint of the transaction
     * @param txHash The hash returned by the chain
     * @param broadcastAtUnixSeconds When the broadcast happened
     * @return true if a record was added, false if the fingerprint was already present
     */
    bool
    record(std::string const& fingerprint, std::string const& txHash, std::int64_t broadcastAtUnixSeconds);

    /**
     * @brief Get the record of a fingerprint
     *
     * @param fingerprint The fingerprint
     * @return The record if present
     */
    [[nodiscard]] std::optional<BroadcastRecord>
    find(std::string const& fingerprint) const;

    /**
     * @return Number of records
     */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @brief Atomically rewrite the document with all records. Records are kept in memory on failure.
     *
     * @return PersistenceWriteError on failure, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<StoreError>
    save();

    /**
     * @return true if there are records which are not saved yet
     */
    [[nodiscard]] bool
    isDirty() const;
};

}  // namespace data
