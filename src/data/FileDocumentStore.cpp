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

#include "data/FileDocumentStore.hpp"

#include "data/Errors.hpp"

#include <fmt/core.h>

#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace data {

FileDocumentStore::FileDocumentStore(std::filesystem::path path) : path_{std::move(path)}
{
}

std::expected<std::optional<std::string>, StoreError>
FileDocumentStore::read() const
{
    std::error_code ec;
    if (not std::filesystem::exists(path_, ec)) {
        if (ec)
            return std::unexpected{StoreError{StoreError::Kind::ReadError, fmt::format("{}: {}", name(), ec.message())}};
        return std::nullopt;
    }

    std::ifstream in{path_, std::ios::in | std::ios::binary};
    if (not in)
        return std::unexpected{StoreError{StoreError::Kind::ReadError, fmt::format("can't open {}", name())}};

    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad())
        return std::unexpected{StoreError{StoreError::Kind::ReadError, fmt::format("can't read {}", name())}};

    return content;
}

std::optional<StoreError>
FileDocumentStore::write(std::string const& content)
{
    std::error_code ec;
    if (path_.has_parent_path())
        std::filesystem::create_directories(path_.parent_path(), ec);

    auto const tmp = std::filesystem::path{path_.string() + ".tmp"};
    std::ofstream out{tmp, std::ios::out | std::ios::binary | std::ios::trunc};
    if (not out)
        return StoreError{StoreError::Kind::PersistenceWriteError, fmt::format("can't open {}", tmp.string())};

    out << content;
    out.flush();
    out.close();
    if (not out) {
        std::filesystem::remove(tmp, ec);
        return StoreError{StoreError::Kind::PersistenceWriteError, fmt::format("can't flush {}", tmp.string())};
    }

    ec.clear();
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        auto const message = fmt::format("can't replace {}: {}", name(), ec.message());
        std::filesystem::remove(tmp, ec);
        return StoreError{StoreError::Kind::PersistenceWriteError, message};
    }

    return std::nullopt;
}

std::string
FileDocumentStore::name() const
{
    return path_.string();
}

}  // namespace data
