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

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace data {

/**
 * @brief Document stored as a regular file
 *
 * Writes go to a sibling temporary file which is flushed and then renamed over the target.
 */
class FileDocumentStore : public DocumentStoreInterface {
    std::filesystem::path path_;

public:
    /**
     * @brief Construct a new store for the file at the given path. The file does not have to exist.
     *
     * @param path Path to the document
     */
    explicit FileDocumentStore(std::filesystem::path path);

    [[nodiscard]] std::expected<std::optional<std::string>, StoreError>
    read() const override;

    [[nodiscard]] std::optional<StoreError>
    write(std::string const& content) override;

    [[nodiscard]] std::string
    name() const override;
};

}  // namespace data
