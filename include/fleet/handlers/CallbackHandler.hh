#pragma once

#include "fleet/core/Handler.hh"

#include <functional>
#include <string>

namespace fleet {

// Adapts a callable into a Handler.
class CallbackHandler : public Handler {
  public:
    using Callback = std::function<HandlerResult(Event&)>;

    CallbackHandler(std::string name, Callback callback);

    std::string getName() const override;
    HandlerResult execute(Event& event) override;

  private:
    std::string name_;
    Callback callback_;
};

} // namespace fleet
