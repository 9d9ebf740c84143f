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

#include "util/config/ConfigDefinition.hpp"

#include <chrono>
#include <cstdint>

namespace scheduler {

/**
 * @brief Scheduler tunables, read-only once created
 */
struct Settings {
    std::uint64_t maxFeeGwei = 20;
    std::chrono::seconds pollInterval{15};
    std::chrono::seconds jitter{5};
    std::uint64_t queueSaveInterval = 20;

    /**
     * @brief Read the settings from a parsed config
     *
     * @param config The config
     * @return The settings
     */
    [[nodiscard]] static Settings
    fromConfig(util::config::SentinelConfigDefinition const& config)
    {
        return Settings{
            .maxFeeGwei = config.get<std::uint64_t>("max_fee_gwei"),
            .pollInterval = std::chrono::seconds{config.get<std::uint32_t>("poll_interval")},
            .jitter = std::chrono::seconds{config.get<std::uint32_t>("jitter")},
            .queueSaveInterval = config.get<std::uint32_t>("queue_save_interval"),
        };
    }
};

}  // namespace scheduler
