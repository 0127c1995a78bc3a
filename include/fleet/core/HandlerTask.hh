#pragma once

#include "fleet/core/Handler.hh"
#include "fleet/core/StateMachine.hh"
#include "fleet/core/Types.hh"

#include <memory>
#include <optional>
#include <string>

namespace fleet {

enum class HandlerState {
    Pending,
    Running,
    Completed,
    Failed
};

std::string handlerStateToString(HandlerState state);

// Lifecycle record wrapped around one Handler instance. Events store tasks,
// not handlers, so handler implementations carry no bookkeeping state.
//
// Pending -> Running -> Completed | Failed. A task never leaves a terminal
// state, which is what keeps the dispatcher from running it twice.
class HandlerTask {
  public:
    explicit HandlerTask(std::unique_ptr<Handler> handler);

    HandlerTask(const HandlerTask&) = delete;
    HandlerTask& operator=(const HandlerTask&) = delete;

    const std::string& getId() const;
    const std::string& getName() const;

    Handler& handler();

    HandlerState getState() const;
    bool isPending() const;
    bool isFinished() const;

    const std::optional<Timestamp>& started() const;
    const std::optional<Timestamp>& completed() const;
    const std::string& message() const;

    // Meaningful only once completed() is set.
    bool success() const;

    // Throws FleetException unless the task is Pending.
    void markStarted(Timestamp when);

    // Throws FleetException unless the task is Running.
    void markFinished(Timestamp when, const HandlerResult& result);

  private:
    std::string id_;
    std::string name_;
    std::unique_ptr<Handler> handler_;
    StateMachine<HandlerState> state_;
    std::optional<Timestamp> started_;
    std::optional<Timestamp> completed_;
    std::string message_;
    bool success_ = false;
};

} // namespace fleet
