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

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <concepts>
#include <memory>
#include <semaphore>
#include <type_traits>
#include <utility>

namespace util {

/**
 * @brief A class to repeat some action, waiting a possibly different interval before each following run
 * @note io_context must be stopped before the Repeat object is destroyed. Otherwise it is undefined behavior
 */
class Repeat {
    struct Control {
        boost::asio::steady_timer timer;
        std::atomic_bool stopping{true};
        std::binary_semaphore semaphore{0};

        Control(auto& ctx) : timer(ctx)
        {
        }
    };

    std::unique_ptr<Control> control_;

public:
    /**
     * @brief Construct a new Repeat object
     * @note The `ctx` parameter is `auto` so that this util supports `strand` and `thread_pool` as well as `io_context`
     *
     * @param ctx The io_context-like object to use
     */
    Repeat(auto& ctx) : control_(std::make_unique<Control>(ctx))
    {
    }

    Repeat(Repeat const&) = delete;
    Repeat&
    operator=(Repeat const&) = delete;
    Repeat(Repeat&&) = default;
    Repeat&
    operator=(Repeat&&) = default;

    /**
     * @brief Stop repeating
     * @note This method will block until the action currently running (if any) returns, so it must not be called from
     * the thread running the context.
     */
    void
    stop();

    /**
     * @brief Start asynchronously repeating. The first run happens as soon as the context picks it up.
     * @note stop() must be called before start() is called for the second time
     *
     * @tparam IntervalProvider Callable returning the delay before the next run
     * @tparam Action The action type
     * @param intervalProvider Called after every run to get the delay before the following one
     * @param action The action to call regularly
     */
    template <typename IntervalProvider, std::invocable Action>
        requires std::invocable<IntervalProvider&> and
                 std::convertible_to<std::invoke_result_t<IntervalProvider&>, std::chrono::steady_clock::duration>
    void
    start(IntervalProvider&& intervalProvider, Action&& action)
    {
        ASSERT(control_->stopping, "Should be stopped before starting");
        control_->stopping = false;
        startImpl(
            std::chrono::steady_clock::duration::zero(),
            std::forward<IntervalProvider>(intervalProvider),
            std::forward<Action>(action)
        );
    }

    /**
     * @brief Start asynchronously repeating with a fixed interval. The first run happens after one interval.
     * @note stop() must be called before start() is called for the second time
     *
     * @tparam Action The action type
     * @param interval The interval to repeat
     * @param action The action to call regularly
     */
    template <std::invocable Action>
    void
    start(std::chrono::steady_clock::duration interval, Action&& action)
    {
        ASSERT(control_->stopping, "Should be stopped before starting");
        control_->stopping = false;
        startImpl(interval, [interval] { return interval; }, std::forward<Action>(action));
    }

private:
    template <typename IntervalProvider, std::invocable Action>
    void
    startImpl(std::chrono::steady_clock::duration delay, IntervalProvider&& intervalProvider, Action&& action)
    {
        control_->timer.expires_after(delay);
        control_->timer.async_wait([this,
                                    intervalProvider = std::forward<IntervalProvider>(intervalProvider),
                                    action = std::forward<Action>(action)](auto const& ec) mutable {
            if (ec or control_->stopping) {
                control_->semaphore.release();
                return;
            }
            action();

            if (control_->stopping) {
                control_->semaphore.release();
                return;
            }

            auto const next = intervalProvider();
            startImpl(next, std::move(intervalProvider), std::move(action));
        });
    }
};

}  // namespace util
