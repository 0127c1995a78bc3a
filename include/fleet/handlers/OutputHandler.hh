#pragma once

#include "fleet/core/Handler.hh"

#include <string>

namespace fleet {

class HandlerFactory;

// Writes the context string "message" to the event's output sink.
class OutputHandler : public Handler {
  public:
    static constexpr const char* kMessageKey = "message";

    std::string getName() const override;
    HandlerResult execute(Event& event) override;
};

// Registers the handlers above that can be built without arguments.
void registerBuiltinHandlers(HandlerFactory& factory);

} // namespace fleet
