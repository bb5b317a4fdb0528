#pragma once

#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <string>

namespace brickforge::async {

/// Default completion token: returns tuple<error_code, T> instead of throwing.
inline const auto use_nothrow = asio::as_tuple(asio::use_awaitable);

enum class Settlement {
    Completed, ///< The operation finished before the deadline.
    Failed,    ///< The operation threw before the deadline.
    TimedOut   ///< The deadline passed first; the operation is still running.
};

struct TimedOutcome {
    Settlement settlement = Settlement::Completed;
    std::string error;
    double elapsedMs = 0.0;

    bool ok() const { return settlement == Settlement::Completed; }
};

/// Race `operation` against a steady_timer on the calling coroutine's executor.
///
/// The operation is spawned, not awaited: when the deadline wins it keeps
/// running to completion and its late result is only logged under `label`.
/// There is no cancellation. Anything the operation captures must stay
/// alive until it settles.
asio::awaitable<TimedOutcome> runWithTimeout(asio::awaitable<void> operation,
                                             std::chrono::steady_clock::duration timeout, std::string label);

/// Milliseconds between two steady_clock points as a double.
double elapsedMs(std::chrono::steady_clock::time_point start,
                 std::chrono::steady_clock::time_point end = std::chrono::steady_clock::now());

/// Message of a captured exception; "unknown error" for non-std exceptions.
std::string describeException(std::exception_ptr error);

} // namespace brickforge::async
