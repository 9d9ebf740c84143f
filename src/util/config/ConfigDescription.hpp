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

#include "util/Assert.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <ostream>
#include <string_view>

namespace util::config {

/**
 * @brief All the config description are stored and extracted from this class
 *
 * Represents all the possible config description
 */
struct SentinelConfigDescription {
public:
    /** @brief Struct to represent a key-value pair*/
    struct KV {
        std::string_view key;
        std::string_view value;
    };

    /**
     * @brief Constructs a new Sentinel Config Description based on pre-existing descriptions
     *
     * Config Keys and it's corresponding descriptions are all predefined. Used to print the config reference
     */
    constexpr SentinelConfigDescription() = default;

    /**
     * @brief Retrieves the description for a given key
     *
     * @param key The key to look up the description for
     * @return The description associated with the key; asserts if the key does not exist
     */
    [[nodiscard]] static constexpr std::string_view
    get(std::string_view key)
    {
        auto const itr = std::ranges::find_if(configDescription, [&](auto const& v) { return v.key == key; });
        ASSERT(itr != configDescription.end(), "Key {} doesn't exist in config", key);
        return itr->value;
    }

    /**
     * @brief Writes every known key with its description, one per line
     *
     * @param stream The stream to write into
     */
    static void
    writeAll(std::ostream& stream)
    {
        for (auto const& [key, value] : configDescription)
            stream << "- " << key << ": " << value << '\n';
    }

    /**
     * @brief Returns the number of described keys
     *
     * @return Number of keys
     */
    [[nodiscard]] static constexpr std::size_t
    size()
    {
        return configDescription.size();
    }

private:
    static constexpr auto configDescription = std::array{
        KV{.key = "chains.[].name", .value = "Unique name of the chain, matched against the chain field of queue items."},
        KV{.key = "chains.[].rpc_url", .value = "HTTP(S) JSON-RPC endpoint used to read the base fee and broadcast."},
        KV{.key = "max_fee_gwei",
           .value = "Global base fee ceiling in gwei. Also the default threshold of items without one."},
        KV{.key = "poll_interval", .value = "Seconds between two scheduler cycles, before jitter."},
        KV{.key = "jitter", .value = "Upper bound in seconds of the random delay added to poll_interval."},
        KV{.key = "queue_file", .value = "Path to the JSON queue document."},
        KV{.key = "state_file", .value = "Path to the JSON broadcast ledger document."},
        KV{.key = "queue_save_interval", .value = "The queue is rewritten every this many fired items."},
        KV{.key = "oracle_timeout", .value = "Seconds before a JSON-RPC request to a chain is abandoned."},
        KV{.key = "log_channels.[].channel", .value = "Name of the log channel."},
        KV{.key = "log_channels.[].log_level", .value = "Log level for the log channel."},
        KV{.key = "log_level", .value = "General logging level of gas-sentinel."},
        KV{.key = "log_format", .value = "Format string for log messages."},
        KV{.key = "log_to_console", .value = "Enable or disable logging to console."},
        KV{.key = "log_directory", .value = "Directory path for log files."},
        KV{.key = "log_rotation_size", .value = "Log rotation size in megabytes."},
        KV{.key = "log_directory_max_size", .value = "Maximum size of the log directory in megabytes."},
        KV{.key = "log_rotation_hour_interval", .value = "Interval in hours for log rotation."},
    };
};

}  // namespace util::config
