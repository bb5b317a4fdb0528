#pragma once

#include "brickforge/core/Log.hh"
#include "brickforge/utils/ErrorHandling.hh"
#include <set>
#include <string>
#include <utility>

namespace brickforge {

// Table-driven state machine. The transition table is shared by every
// instance of one state type, so a registry can hold one machine per entry
// without copying it. Self-transitions are no-ops. Not synchronized.
template <typename StateEnum> class StateMachine {
  public:
    using TransitionTable = std::set<std::pair<StateEnum, StateEnum>>;
    using ToStringFn = std::string (*)(StateEnum);

    StateMachine(StateEnum initialState, const TransitionTable& transitions, ToStringFn toStringFn)
        : currentState_(initialState), transitions_(&transitions), toStringFn_(toStringFn) {}

    StateEnum getState() const { return currentState_; }

    bool canTransition(StateEnum to) const { return isValidTransition(currentState_, to); }

    bool isValidTransition(StateEnum from, StateEnum to) const {
        if (from == to)
            return true;
        return transitions_->count({from, to}) > 0;
    }

    // Returns InvalidState without changing anything when the table forbids it.
    Result<void> tryTransition(StateEnum state) {
        if (currentState_ == state) {
            return Result<void>::ok();
        }

        if (!canTransition(state)) {
            return Result<void>::error(ErrorCode::InvalidState, "Invalid state transition from " +
                                                                    toStringFn_(currentState_) + " to " +
                                                                    toStringFn_(state));
        }

        BRICKFORGE_LOG_DEBUG("State transition: {} -> {}", toStringFn_(currentState_), toStringFn_(state));
        currentState_ = state;
        return Result<void>::ok();
    }

    // Throws BrickforgeException if the transition is invalid.
    void setState(StateEnum state) {
        auto result = tryTransition(state);
        if (result.isError()) {
            throwError(result.message());
        }
    }

  private:
    StateEnum currentState_;
    const TransitionTable* transitions_;
    ToStringFn toStringFn_;
};

} // namespace brickforge
