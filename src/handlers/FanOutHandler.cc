#include "fleet/handlers/FanOutHandler.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/Log.hh"
#include "fleet/utils/ErrorHandling.hh"

namespace fleet {

FanOutHandler::FanOutHandler(std::string name, std::string itemsKey, ItemHandlerFn makeHandler)
    : name_(std::move(name)), itemsKey_(std::move(itemsKey)), makeHandler_(std::move(makeHandler)) {
    if (!makeHandler_) {
        throwError("FanOutHandler '" + name_ + "' requires a handler constructor");
    }
}

std::string FanOutHandler::getName() const {
    return name_;
}

HandlerResult FanOutHandler::execute(Event& event) {
    if (!event.context().has(itemsKey_)) {
        return HandlerResult::failure("Context key '" + itemsKey_ + "' not found");
    }
    auto items = event.context().get<std::vector<std::string>>(itemsKey_);

    // Build every follow-up before queueing any, so a bad item queues nothing.
    std::vector<std::unique_ptr<Handler>> handlers;
    handlers.reserve(items.size());
    for (const auto& item : items) {
        auto handler = makeHandler_(item);
        if (!handler) {
            return HandlerResult::failure("No handler produced for item '" + item + "'");
        }
        handlers.push_back(std::move(handler));
    }

    for (auto& handler : handlers) {
        event.enqueue(std::move(handler));
    }

    FLEET_LOG_DEBUG("{} queued {} handlers from '{}'", name_, handlers.size(), itemsKey_);
    return HandlerResult::ok("Queued " + std::to_string(handlers.size()) + " handlers");
}

} // namespace fleet
