#include "fleet/handlers/OutputHandler.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/HandlerFactory.hh"

namespace fleet {

std::string OutputHandler::getName() const {
    return "OutputHandler";
}

HandlerResult OutputHandler::execute(Event& event) {
    if (!event.context().has(kMessageKey)) {
        return HandlerResult::failure(std::string("Context key '") + kMessageKey + "' not found");
    }
    auto message = event.context().get<std::string>(kMessageKey);
    event.output(message);
    return HandlerResult::ok();
}

void registerBuiltinHandlers(HandlerFactory& factory) {
    FLEET_REGISTER_HANDLER(factory, OutputHandler);
}

} // namespace fleet
