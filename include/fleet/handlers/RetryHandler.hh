#pragma once

#include "fleet/core/HandlerFactory.hh"

#include <string>

namespace fleet {

// Runs a freshly constructed inner handler. When it fails and attempts
// remain, queues a new RetryHandler (and with it a new inner instance) with
// one attempt fewer. Instances are never run twice; the retry is a new task.
class RetryHandler : public Handler {
  public:
    RetryHandler(HandlerConstructor constructor, int attempts);

    std::string getName() const override;
    HandlerResult execute(Event& event) override;

    int attemptsLeft() const;

  private:
    // Restricts the requeue constructor below to RetryHandler itself.
    struct Requeue {
        explicit Requeue() = default;
    };

  public:
    RetryHandler(Requeue, HandlerConstructor constructor, int attempts, std::string innerName);

  private:
    HandlerConstructor constructor_;
    int attempts_;
    std::string innerName_;
};

} // namespace fleet
