#pragma once

// Helpers for driving brickforge coroutines from synchronous test code.

#include "brickforge/core/GameState.hh"
#include "brickforge/utils/ErrorHandling.hh"

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace brickforge::Testing {

namespace detail {

// Result<T> has no default constructor, so the value is handed out through
// an optional instead of co_spawn's completion signature.
template <typename T> asio::awaitable<void> storeInto(asio::awaitable<T> operation, std::optional<T>& out) {
    out.emplace(co_await std::move(operation));
}

inline void runUntil(asio::io_context& io, const bool& done) {
    io.restart();
    while (!done && io.run_one() > 0) {
    }
}

} // namespace detail

/// Run `operation` on `io` until it finishes and return its value.
/// Work it leaves behind (a timed-out init still sleeping) stays queued on
/// `io`; use drain() to let it settle. Rethrows what the coroutine threw.
template <typename T> T runAwaitable(asio::io_context& io, asio::awaitable<T> operation) {
    std::optional<T> value;
    std::exception_ptr error;
    bool done = false;

    asio::co_spawn(io, detail::storeInto(std::move(operation), value), [&](std::exception_ptr e) {
        error = e;
        done = true;
    });
    detail::runUntil(io, done);

    if (error) {
        std::rethrow_exception(error);
    }
    if (!value) {
        throwError("awaitable did not complete");
    }
    return std::move(*value);
}

inline void runAwaitable(asio::io_context& io, asio::awaitable<void> operation) {
    std::exception_ptr error;
    bool done = false;

    asio::co_spawn(io, std::move(operation), [&](std::exception_ptr e) {
        error = e;
        done = true;
    });
    detail::runUntil(io, done);

    if (error) {
        std::rethrow_exception(error);
    }
    if (!done) {
        throwError("awaitable did not complete");
    }
}

/// Run everything still queued on `io`.
inline void drain(asio::io_context& io) {
    io.restart();
    io.run();
}

/// Suspend the calling coroutine for `duration` on its own executor.
inline asio::awaitable<void> delayFor(std::chrono::milliseconds duration) {
    asio::steady_timer timer(co_await asio::this_coro::executor, duration);
    co_await timer.async_wait(asio::use_awaitable);
}

/// In-memory GameState with public entity storage.
class FakeGameState : public GameState {
  public:
    std::vector<Ball>& balls() override { return balls_; }
    const std::vector<Ball>& balls() const override { return balls_; }

    Paddle& paddle() override { return paddle_; }
    const Paddle& paddle() const override { return paddle_; }

    std::vector<Block>& blocks() override { return blocks_; }
    const std::vector<Block>& blocks() const override { return blocks_; }

    const std::vector<ActivePowerUp>& activePowerUps() const override { return activePowerUps_; }

    void activate(ActivePowerUp powerUp) { activePowerUps_.push_back(std::move(powerUp)); }
    void clearActive() { activePowerUps_.clear(); }

  private:
    std::vector<Ball> balls_;
    Paddle paddle_;
    std::vector<Block> blocks_;
    std::vector<ActivePowerUp> activePowerUps_;
};

} // namespace brickforge::Testing
