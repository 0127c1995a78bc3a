#pragma once

#include "fleet/core/Log.hh"
#include "fleet/utils/ErrorHandling.hh"
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace fleet {

// Transition-checked state machine.
// Thread-safe via mutex. Self-transitions are no-ops.
template <typename StateEnum> class StateMachine {
  public:
    using ToStringFn = std::function<std::string(StateEnum)>;

    StateMachine(StateEnum initialState, ToStringFn toStringFn)
        : currentState_(initialState), toStringFn_(std::move(toStringFn)) {}

    void addTransition(StateEnum from, StateEnum to) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        transitions_.insert({from, to});
    }

    void setState(StateEnum state) {
        StateEnum oldState;

        {
            std::lock_guard<std::mutex> lock(stateMutex_);

            if (currentState_ == state) {
                return;
            }

            if (transitions_.count({currentState_, state}) == 0) {
                throwError("Invalid state transition from " + toStringFn_(currentState_) + " to " + toStringFn_(state));
            }

            oldState = currentState_;
            currentState_ = state;
        }

        FLEET_LOG_TRACE("State transition: {} -> {}", toStringFn_(oldState), toStringFn_(state));
    }

    StateEnum getState() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return currentState_;
    }

  private:
    mutable std::mutex stateMutex_;
    StateEnum currentState_;
    ToStringFn toStringFn_;
    std::set<std::pair<StateEnum, StateEnum>> transitions_;
};

} // namespace fleet
