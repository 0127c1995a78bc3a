#include "fleet/core/HandlerTask.hh"

#include "fleet/utils/ErrorHandling.hh"
#include "fleet/utils/Utils.hh"

namespace fleet {

std::string handlerStateToString(HandlerState state) {
    switch (state) {
        case HandlerState::Pending:
            return "pending";
        case HandlerState::Running:
            return "running";
        case HandlerState::Completed:
            return "completed";
        case HandlerState::Failed:
            return "failed";
    }
    return "unknown";
}

HandlerTask::HandlerTask(std::unique_ptr<Handler> handler)
    : id_(Utils::generateUniqueId("task_")),
      handler_(std::move(handler)),
      state_(HandlerState::Pending, handlerStateToString) {
    if (!handler_) {
        throwError("HandlerTask requires a handler");
    }
    name_ = handler_->getName();

    state_.addTransition(HandlerState::Pending, HandlerState::Running);
    state_.addTransition(HandlerState::Running, HandlerState::Completed);
    state_.addTransition(HandlerState::Running, HandlerState::Failed);
}

const std::string& HandlerTask::getId() const {
    return id_;
}

const std::string& HandlerTask::getName() const {
    return name_;
}

Handler& HandlerTask::handler() {
    return *handler_;
}

HandlerState HandlerTask::getState() const {
    return state_.getState();
}

bool HandlerTask::isPending() const {
    return getState() == HandlerState::Pending;
}

bool HandlerTask::isFinished() const {
    auto state = getState();
    return state == HandlerState::Completed || state == HandlerState::Failed;
}

const std::optional<Timestamp>& HandlerTask::started() const {
    return started_;
}

const std::optional<Timestamp>& HandlerTask::completed() const {
    return completed_;
}

const std::string& HandlerTask::message() const {
    return message_;
}

bool HandlerTask::success() const {
    return success_;
}

void HandlerTask::markStarted(Timestamp when) {
    if (getState() != HandlerState::Pending) {
        throwError("Handler '" + name_ + "' has already been started");
    }
    state_.setState(HandlerState::Running);
    started_ = when;
}

void HandlerTask::markFinished(Timestamp when, const HandlerResult& result) {
    if (getState() != HandlerState::Running) {
        throwError("Handler '" + name_ + "' is not running");
    }
    state_.setState(result.success ? HandlerState::Completed : HandlerState::Failed);
    completed_ = when;
    success_ = result.success;
    message_ = result.message;
}

} // namespace fleet
