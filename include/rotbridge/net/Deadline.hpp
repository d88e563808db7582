#pragma once
#include "rotbridge/net/NetConfig.hpp"
#include "rotbridge/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they cannot access
 *   destroyed synchronisation primitives even if they run after this function
 *   returns.
 * - The `cancel()` functor must cancel the same socket or acceptor that
 *   launched the operation; callers supply it so ownership stays at the call
 *   site.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running on another
 *   thread while we block. Never call these helpers from that thread.
 */
namespace rotbridge::net {

using duration = std::chrono::milliseconds;

/// Applied to clients that never had a timeout set.
constexpr duration DEFAULT_IO_TIMEOUT{1000};

/// Negative timeouts become zero, which read helpers treat as "no deadline".
inline duration sanitizeTimeout(duration timeout) {
    return timeout.count() < 0 ? duration::zero() : timeout;
}

namespace detail {

struct WaitState {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    std::error_code ec = asio::error::would_block;
};

inline std::error_code wait_done(const std::shared_ptr<WaitState>& st) {
    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace detail

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    auto st = std::make_shared<detail::WaitState>();
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

    // Kick off the async operation (it must call our op_handler)
    start_async(op_handler);

    // Arm the deadline
    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer, timeout](const std::error_code& tec){
        if (tec == asio::error::operation_aborted) {
            // Cancelled because the operation finished first, so nothing to do.
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return; // operation already completed; no need to cancel
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        logInfo("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel();
        st->cv.notify_one();
    });

    return detail::wait_done(st);
}

/**
 * @brief Same completion plumbing as `with_deadline` but with no timer.
 *
 * Blocks until the operation completes on its own or is cancelled from the
 * outside (socket cancel/close posted to the I/O thread).
 */
template<typename StartAsync>
std::error_code without_deadline(StartAsync start_async)
{
    auto st = std::make_shared<detail::WaitState>();

    auto op_handler = [st](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
    };

    start_async(op_handler);

    return detail::wait_done(st);
}

} // namespace rotbridge::net
