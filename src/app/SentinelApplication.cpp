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

#include "app/SentinelApplication.hpp"

#include "chain/ChainRegistry.hpp"
#include "data/BroadcastLedger.hpp"
#include "data/FileDocumentStore.hpp"
#include "data/PersistentQueue.hpp"
#include "scheduler/Scheduler.hpp"
#include "scheduler/Settings.hpp"
#include "util/Repeat.hpp"
#include "util/build/Build.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace app {

SentinelApplication::SentinelApplication(util::config::SentinelConfigDefinition const& config) : config_(config)
{
    LOG(util::LogService::info()) << "gas-sentinel version: " << util::build::getSentinelFullVersionString();
}

int
SentinelApplication::run()
{
    auto registry = chain::makeChainRegistry(config_);
    if (not registry.has_value()) {
        LOG(log_.error()) << "Error creating chains: " << registry.error();
        return EXIT_FAILURE;
    }
    LOG(log_.info()) << "Chains: " << boost::algorithm::join(registry->names(), ", ");

    auto const settings = scheduler::Settings::fromConfig(config_);

    // the ledger must be loaded first: it decides which queued items are already done
    data::BroadcastLedger ledger{std::make_shared<data::FileDocumentStore>(config_.get<std::string>("state_file"))};
    if (auto const err = ledger.load(); err.has_value()) {
        LOG(log_.error()) << "Can't load broadcast ledger: " << *err;
        return EXIT_FAILURE;
    }

    data::PersistentQueue queue{
        std::make_shared<data::FileDocumentStore>(config_.get<std::string>("queue_file")), settings.maxFeeGwei
    };
    auto items = queue.load();
    if (not items.has_value()) {
        LOG(log_.error()) << "Can't load queue: " << items.error();
        return EXIT_FAILURE;
    }

    scheduler::Scheduler scheduler{
        settings, std::move(registry).value(), std::move(queue), std::move(ledger), std::move(items).value()
    };
    scheduler.reconcile();

    // Scheduling runs on its own thread; the main thread only waits for a stop signal.
    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    util::Repeat repeat{ioc};
    repeat.start([&scheduler] { return scheduler.nextDelay(); }, [&scheduler] { scheduler.runCycle(); });
    std::thread worker{[&ioc] { ioc.run(); }};

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals{signalContext, SIGINT, SIGTERM};
    signals.async_wait([this](boost::system::error_code const& ec, int signal) {
        if (not ec)
            LOG(log_.info()) << "Received signal " << signal << ", stopping";
    });
    signalContext.run();

    // Blocks until the cycle in progress is finished
    repeat.stop();
    work.reset();
    ioc.stop();
    worker.join();

    if (not scheduler.flush()) {
        LOG(log_.error()) << "Exiting with unsaved state, the next start will resume from the last saved one";
        return EXIT_FAILURE;
    }

    LOG(log_.info()) << "Stopped with " << scheduler.items().size() << " items queued";
    return EXIT_SUCCESS;
}

}  // namespace app
