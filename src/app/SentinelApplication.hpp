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
#include "util/log/Logger.hpp"

namespace app {

/**
 * @brief The gas-sentinel application.
 */
class SentinelApplication {
    util::Logger log_{"App"};
    util::config::SentinelConfigDefinition const& config_;

public:
    /**
     * @brief Construct a new SentinelApplication object
     *
     * @param config The configuration of the application
     */
    SentinelApplication(util::config::SentinelConfigDefinition const& config);

    /**
     * @brief Run the application
     *
     * Blocks until SIGINT or SIGTERM is received, then stops scheduling and saves all state.
     *
     * @return exit code
     */
    int
    run();
};

}  // namespace app
