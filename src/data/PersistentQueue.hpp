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

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace data {

/**
 * @brief Durable, ordered collection of transactions waiting to be broadcast
 *
 * The queue does not keep items in memory; the owner of the items loads them once and hands the full list back on
 * every save. The document is a JSON array of objects with the fields `chain`, `rawTx`, `label`, `minBaseFeeGwei` and
 * `attempts`; unknown fields are ignored.
 */
class PersistentQueue {
    util::Logger log_{"Queue"};
    std::shared_ptr<DocumentStoreInterface> store_;
    std::uint64_t defaultMinBaseFeeGwei_;

public:
    /**
     * @brief Construct a new PersistentQueue
     *
     * @param store The document holding the queue
     * @param defaultMinBaseFeeGwei Threshold given to items that don't specify `minBaseFeeGwei`
     */
    PersistentQueue(std::shared_ptr<DocumentStoreInterface> store, std::uint64_t defaultMinBaseFeeGwei);

    /**
     * @brief Read all items in document order
     *
     * A missing document or one holding only whitespace is an empty queue.
     *
     * @return The items; CorruptQueue if the document is malformed, ReadError if it can't be read
     */
    [[nodiscard]] std::expected<std::vector<QueueItem>, StoreError>
    load() const;

    /**
     * @brief Atomically replace the document with the given items
     *
     * @param items All items, in order
     * @return PersistenceWriteError on failure, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<StoreError>
    save(std::vector<QueueItem> const& items);

    /**
     * @return Name of the backing document
     */
    [[nodiscard]] std::string
    name() const;
};

}  // namespace data
