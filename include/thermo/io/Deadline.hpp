#pragma once
#include "thermo/io/IoConfig.hpp"
#include "thermo/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation and block until it completes or a deadline passes.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 *
 * A zero timeout waits for the operation without arming the timer, which is
 * how a transport opts out of write deadlines.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they cannot access
 *   destroyed synchronisation primitives even if they run after this function
 *   returns.
 * - The `cancel()` functor must cancel the same port or timer that launched
 *   the operation.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running on another
 *   thread while we block. Otherwise the wait would never complete.
 */
namespace thermo::io {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    // Completion of the user async op
    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // another path already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();                // wake waiter first...
        timer->cancel();                    // ...then cancel timer (handler must be benign)
    };

    start_async(op_handler);

    if (timeout.count() > 0) {
        timer->expires_after(timeout);
        timer->async_wait([st, cancel, timer, timeout](const std::error_code& tec){
            if (tec == asio::error::operation_aborted) {
                return; // the operation finished first
            }
            {
                std::lock_guard<std::mutex> lk(st->m);
                if (st->done) {
                    return;
                }
                st->ec = asio::error::timed_out;
                st->done = true;
            }
            log::logError("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
            cancel();
            st->cv.notify_one();
        });
    }

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace thermo::io
