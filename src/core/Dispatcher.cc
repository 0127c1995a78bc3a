#include "fleet/core/Dispatcher.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/Log.hh"
#include "fleet/utils/ErrorHandling.hh"

#include <utility>

namespace fleet {

Dispatcher::Dispatcher() = default;

Dispatcher::Dispatcher(DispatchPolicy policy, ClockFn clock) : policy_(policy), clock_(std::move(clock)) {}

const DispatchPolicy& Dispatcher::getPolicy() const {
    return policy_;
}

void Dispatcher::setPolicy(DispatchPolicy policy) {
    policy_ = policy;
}

void Dispatcher::setClock(ClockFn clock) {
    clock_ = std::move(clock);
}

Timestamp Dispatcher::now() const {
    return clock_ ? clock_() : Clock::now();
}

void Dispatcher::fileAborted(Event& event, std::unique_ptr<HandlerTask> task, const std::string& reason) const {
    FLEET_DISPATCH_LOG_WARN("Handler '{}' aborted event '{}': {}", task->getName(), event.getType(), reason);
    task->markFinished(now(), HandlerResult::failure("aborted: " + reason));
    event.output(task->getName() + ": aborted - " + reason);
    event.pushHandler(std::move(task), Bucket::Failed);
}

DispatchSummary Dispatcher::dispatch(Event& event) const {
    DispatchSummary summary;
    FLEET_DISPATCH_LOG_INFO("Dispatching event '{}' with {} queued handlers", event.getType(),
                            event.count(Bucket::Incomplete));

    while (true) {
        if (policy_.maxHandlers != 0 && summary.executed >= policy_.maxHandlers &&
            event.count(Bucket::Incomplete) > 0) {
            std::string message = "Event '" + event.getType() + "' exceeded the limit of " +
                                  std::to_string(policy_.maxHandlers) + " handler executions";
            FLEET_DISPATCH_LOG_WARN("{}", message);
            throw DispatchLimitException(message);
        }

        auto task = event.popHandler(Bucket::Incomplete);
        if (!task) {
            break;
        }

        task->markStarted(now());
        FLEET_DISPATCH_LOG_DEBUG("Running handler '{}' ({})", task->getName(), task->getId());

        HandlerResult result;
        try {
            result = task->handler().execute(event);
        } catch (const HandlerIncompatibleException& e) {
            fileAborted(event, std::move(task), e.what());
            throw;
        } catch (const HandlerResolutionException& e) {
            fileAborted(event, std::move(task), e.what());
            throw;
        } catch (const DispatchLimitException& e) {
            fileAborted(event, std::move(task), e.what());
            throw;
        } catch (const std::exception& e) {
            result = HandlerResult::failure(e.what());
        } catch (...) {
            fileAborted(event, std::move(task), "unknown exception");
            throw;
        }

        task->markFinished(now(), result);
        ++summary.executed;

        std::string line = task->getName() + (result.success ? ": completed" : ": failed");
        if (!result.message.empty()) {
            line += " - " + result.message;
        }
        event.output(line);

        if (result.success) {
            ++summary.completed;
            FLEET_DISPATCH_LOG_DEBUG("Handler '{}' completed", task->getName());
            event.pushHandler(std::move(task), Bucket::Complete);
        } else {
            ++summary.failed;
            FLEET_DISPATCH_LOG_WARN("Handler '{}' failed: {}", task->getName(), result.message);
            event.pushHandler(std::move(task), Bucket::Failed);

            if (policy_.stopOnFirstFailure) {
                summary.halted = true;
                FLEET_DISPATCH_LOG_INFO("Stopping event '{}' after first failure, {} handlers left queued",
                                        event.getType(), event.count(Bucket::Incomplete));
                break;
            }
        }
    }

    FLEET_DISPATCH_LOG_INFO("Event '{}' finished: {} executed, {} completed, {} failed", event.getType(),
                            summary.executed, summary.completed, summary.failed);
    return summary;
}

} // namespace fleet
