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

#include "data/Errors.hpp"

#include <expected>
#include <optional>
#include <string>

namespace data {

/**
 * @brief A single document that is always read whole and replaced whole
 */
class DocumentStoreInterface {
public:
    virtual ~DocumentStoreInterface() = default;

    /**
     * @brief Read the whole document
     *
     * @return The content; std::nullopt if the document does not exist; ReadError on any other failure
     */
    [[nodiscard]] virtual std::expected<std::optional<std::string>, StoreError>
    read() const = 0;

    /**
     * @brief Replace the whole document. Readers see either the old or the new content, never a mix.
     *
     * @param content The new content
     * @return PersistenceWriteError on failure, std::nullopt otherwise
     */
    [[nodiscard]] virtual std::optional<StoreError>
    write(std::string const& content) = 0;

    /**
     * @return Human readable name of the document used in logs
     */
    [[nodiscard]] virtual std::string
    name() const = 0;
};

}  // namespace data
