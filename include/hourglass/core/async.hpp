#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "hourglass/core/error.hpp"
#include "hourglass/core/logger.hpp"

// Coroutine helpers shared by the hook registry and the cron service.
//
// All of them use the same signalling scheme: a steady_timer that waits
// "forever" (or until a deadline) and is cancelled by whoever finishes the
// work. The helpers assume a single-threaded executor for the awaiting side.

namespace hourglass::async {

using boost::asio::awaitable;

namespace detail {

inline auto describe_exception(const std::exception_ptr& ep) -> std::string {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

template <typename T>
struct TimeoutState {
    explicit TimeoutState(const boost::asio::any_io_executor& ex) : timer(ex) {}

    std::optional<Result<T>> result;
    boost::asio::steady_timer timer;
};

} // namespace detail

/// Run `op` on the current executor and wait at most `timeout` for it.
///
/// Returns the operation's value, `ErrorCode::Timeout` if the deadline
/// passed first, or `ErrorCode::ExecutionFailed` if the operation threw.
/// A timed-out operation is abandoned, not cancelled: it keeps running on
/// the executor and its late result is discarded.
template <typename T>
auto with_timeout(awaitable<T> op, std::chrono::milliseconds timeout)
    -> awaitable<Result<T>>
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<detail::TimeoutState<T>>(executor);
    state->timer.expires_after(timeout);

    if constexpr (std::is_void_v<T>) {
        boost::asio::co_spawn(executor, std::move(op),
            [state](std::exception_ptr ep) {
                if (ep) {
                    state->result = std::unexpected(make_error(
                        ErrorCode::ExecutionFailed, "Operation threw",
                        detail::describe_exception(ep)));
                } else {
                    state->result = Result<void>{};
                }
                state->timer.cancel();
            });
    } else {
        boost::asio::co_spawn(executor, std::move(op),
            [state](std::exception_ptr ep, T value) {
                if (ep) {
                    state->result = std::unexpected(make_error(
                        ErrorCode::ExecutionFailed, "Operation threw",
                        detail::describe_exception(ep)));
                } else {
                    state->result = Result<T>(std::move(value));
                }
                state->timer.cancel();
            });
    }

    boost::system::error_code ec;
    if (!state->result) {
        co_await state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!state->result) {
        co_return make_fail(make_error(
            ErrorCode::Timeout, "Operation timed out",
            "after " + std::to_string(timeout.count()) + "ms"));
    }
    co_return std::move(*state->result);
}

/// Spawn every operation on the current executor and wait until all of
/// them have finished. Exceptions are logged, not rethrown.
inline auto when_all(std::vector<awaitable<void>> ops) -> awaitable<void> {
    if (ops.empty()) co_return;

    struct JoinState {
        explicit JoinState(const boost::asio::any_io_executor& ex) : timer(ex) {}
        std::size_t remaining = 0;
        boost::asio::steady_timer timer;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<JoinState>(executor);
    state->remaining = ops.size();
    state->timer.expires_at(boost::asio::steady_timer::time_point::max());

    for (auto& op : ops) {
        boost::asio::co_spawn(executor, std::move(op),
            [state](std::exception_ptr ep) {
                if (ep) {
                    LOG_ERROR("Joined operation failed: {}",
                              detail::describe_exception(ep));
                }
                if (--state->remaining == 0) {
                    state->timer.cancel();
                }
            });
    }

    boost::system::error_code ec;
    while (state->remaining > 0) {
        co_await state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

/// Run a blocking callable on `pool` and suspend until it returns.
/// An exception thrown by `fn` is rethrown in the awaiting coroutine.
template <typename F>
auto offload(boost::asio::thread_pool& pool, F fn) -> awaitable<void> {
    struct OffloadState {
        explicit OffloadState(const boost::asio::any_io_executor& ex) : timer(ex) {}
        boost::asio::steady_timer timer;
        bool done = false;
        std::exception_ptr error;
    };

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<OffloadState>(executor);
    state->timer.expires_at(boost::asio::steady_timer::time_point::max());

    boost::asio::post(pool, [state, fn = std::move(fn)]() mutable {
        std::exception_ptr ep;
        try {
            fn();
        } catch (...) {
            ep = std::current_exception();
        }
        // Hand the outcome back to the awaiting executor for thread safety.
        boost::asio::post(state->timer.get_executor(), [state, ep] {
            state->done = true;
            state->error = ep;
            state->timer.cancel();
        });
    });

    boost::system::error_code ec;
    while (!state->done) {
        co_await state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    if (state->error) {
        std::rethrow_exception(state->error);
    }
}

} // namespace hourglass::async
