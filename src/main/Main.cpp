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

#include "app/CliArgs.hpp"
#include "app/SentinelApplication.hpp"
#include "app/VerifyConfig.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

int
main(int argc, char const* argv[])
try {
    auto const action = app::CliArgs::parse(argc, argv);
    return action.apply(
        [](app::CliArgs::Action::Exit const& exit) { return exit.exitCode; },
        [](app::CliArgs::Action::VerifyConfig const& verify) {
            if (app::verifyConfig(verify.configPath)) {
                std::cout << "Config " << verify.configPath << " is correct" << "\n";
                return EXIT_SUCCESS;
            }
            return EXIT_FAILURE;
        },
        [](app::CliArgs::Action::Run const& run) {
            auto config = util::config::makeSentinelConfig();
            if (not app::parseConfig(config, run.configPath))
                return EXIT_FAILURE;

            util::LogService::init(config);
            app::SentinelApplication sentinel{config};
            return sentinel.run();
        }
    );
} catch (std::exception const& e) {
    LOG(util::LogService::fatal()) << "Exit on exception: " << e.what();
    return EXIT_FAILURE;
}
