#include "brickforge/core/Async.hh"
#include "brickforge/core/Log.hh"

#include <memory>
#include <utility>

namespace brickforge::async {

namespace {

// Shared between the racing coroutine and the spawned operation's
// completion handler; whichever outlives the other keeps it alive.
struct RaceState {
    explicit RaceState(asio::any_io_executor executor) : signal(std::move(executor)) {}

    asio::steady_timer signal;
    bool settled = false;
    bool abandoned = false;
    std::exception_ptr error;
    std::string label;
};

} // namespace

double elapsedMs(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

std::string describeException(std::exception_ptr error) {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

asio::awaitable<TimedOutcome> runWithTimeout(asio::awaitable<void> operation,
                                             std::chrono::steady_clock::duration timeout, std::string label) {
    auto executor = co_await asio::this_coro::executor;
    auto state = std::make_shared<RaceState>(executor);
    state->label = std::move(label);
    state->signal.expires_after(timeout);

    const auto start = std::chrono::steady_clock::now();

    asio::co_spawn(executor, std::move(operation), [state](std::exception_ptr error) {
        state->settled = true;
        state->error = error;
        if (state->abandoned) {
            if (error) {
                BRICKFORGE_LOG_WARN("{} failed after its deadline: {}", state->label, describeException(error));
            } else {
                BRICKFORGE_LOG_WARN("{} completed after its deadline", state->label);
            }
            return;
        }
        state->signal.cancel();
    });

    // co_spawn may dispatch inline; only wait when the operation is pending.
    if (!state->settled) {
        auto [ec] = co_await state->signal.async_wait(use_nothrow);
        (void)ec;
    }

    TimedOutcome outcome;
    outcome.elapsedMs = elapsedMs(start);

    if (!state->settled) {
        state->abandoned = true;
        outcome.settlement = Settlement::TimedOut;
        outcome.error = state->label + " timed out after " +
                        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) + "ms";
        co_return outcome;
    }

    if (state->error) {
        outcome.settlement = Settlement::Failed;
        outcome.error = describeException(state->error);
        co_return outcome;
    }

    outcome.settlement = Settlement::Completed;
    co_return outcome;
}

} // namespace brickforge::async
