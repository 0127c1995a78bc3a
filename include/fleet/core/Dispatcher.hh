#pragma once

#include "fleet/core/Handler.hh"
#include "fleet/core/Types.hh"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace fleet {

class Event;
class HandlerTask;

struct DispatchPolicy {
    // Leave the remaining handlers queued once one handler has failed.
    bool stopOnFirstFailure = false;

    // Upper bound on handler executions per dispatch; 0 disables it.
    std::size_t maxHandlers = 10000;

    bool operator==(const DispatchPolicy&) const = default;
};

struct DispatchSummary {
    std::size_t executed = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    bool halted = false;

    bool ok() const { return failed == 0; }

    bool operator==(const DispatchSummary&) const = default;
};

// Drains an event's incomplete bucket, one handler at a time, oldest first.
//
// The bucket is re-checked after every execution, so handlers queued during
// a run (fan-out, explicit retries) are picked up by the same dispatch.
// Handler failures are captured into the task and filed under failed.
// Structural errors (HandlerIncompatibleException, HandlerResolutionException,
// DispatchLimitException) and anything thrown that is not a std::exception
// escape; the task that raised one is filed under failed first and everything
// still queued stays in incomplete.
class Dispatcher {
  public:
    using ClockFn = std::function<Timestamp()>;

    Dispatcher();
    explicit Dispatcher(DispatchPolicy policy, ClockFn clock = nullptr);

    DispatchSummary dispatch(Event& event) const;

    const DispatchPolicy& getPolicy() const;
    void setPolicy(DispatchPolicy policy);
    void setClock(ClockFn clock);

  private:
    Timestamp now() const;
    void fileAborted(Event& event, std::unique_ptr<HandlerTask> task, const std::string& reason) const;

    DispatchPolicy policy_;
    ClockFn clock_;
};

} // namespace fleet
