#include "fleet/handlers/CallbackHandler.hh"
#include "fleet/utils/ErrorHandling.hh"

namespace fleet {

CallbackHandler::CallbackHandler(std::string name, Callback callback)
    : name_(std::move(name)), callback_(std::move(callback)) {
    if (name_.empty()) {
        throwError("CallbackHandler name cannot be empty");
    }
    if (!callback_) {
        throwError("CallbackHandler '" + name_ + "' requires a callback");
    }
}

std::string CallbackHandler::getName() const {
    return name_;
}

HandlerResult CallbackHandler::execute(Event& event) {
    return callback_(event);
}

} // namespace fleet
