#pragma once

#include "fleet/core/Handler.hh"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fleet {

// Expands into one follow-up handler per item of a context list, e.g. one
// per-site handler for every site of a group. The follow-ups run later in
// the same dispatch, behind whatever was already queued.
//
// The list is read as std::vector<std::string> from the context key given
// at construction; a missing key is reported as a failure.
class FanOutHandler : public Handler {
  public:
    using ItemHandlerFn = std::function<std::unique_ptr<Handler>(const std::string& item)>;

    FanOutHandler(std::string name, std::string itemsKey, ItemHandlerFn makeHandler);

    std::string getName() const override;
    HandlerResult execute(Event& event) override;

  private:
    std::string name_;
    std::string itemsKey_;
    ItemHandlerFn makeHandler_;
};

} // namespace fleet
