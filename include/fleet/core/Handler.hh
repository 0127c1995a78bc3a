#pragma once

#include <string>
#include <utility>

namespace fleet {

class Event;

// Outcome a handler reports for one execution.
struct HandlerResult {
    bool success = true;
    std::string message;

    static HandlerResult ok(std::string message = "") { return HandlerResult{true, std::move(message)}; }
    static HandlerResult failure(std::string message) { return HandlerResult{false, std::move(message)}; }
};

// A unit of work bound to an event type.
//
// execute() receives the owning event so it can read and write the shared
// context, inspect the site, write to the output sink, or enqueue follow-up
// handlers for the same run. Throwing HandlerError (or any std::exception
// other than the structural Fleet exceptions) is reported as a failure.
class Handler {
  public:
    virtual ~Handler() = default;

    // Identity shown in debug snapshots and output lines.
    virtual std::string getName() const = 0;

    virtual HandlerResult execute(Event& event) = 0;
};

} // namespace fleet
