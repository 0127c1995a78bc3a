#pragma once

#include "fleet/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fleet {

class DataLoader;

// Static description of one handler bound to an event type.
struct HandlerDescriptor {
    std::string type;
    std::string className;
    std::optional<std::string> path;

    bool operator==(const HandlerDescriptor&) const = default;
};

// Snapshot of the platform registry. Copied into every Event on construction,
// so later changes to the source never reach a running event.
//
// File format:
//   [[events]]
//   type = "site_duplication_scrub"
//   class = "ScrubUsers"
//   path = "modules/scrub"   # optional
//
// Keys other than `events` are kept verbatim in data().
class Registry {
  public:
    Registry() = default;
    explicit Registry(std::vector<HandlerDescriptor> events);

    static Result<Registry> fromLoader(const DataLoader& loader);
    static Result<Registry> parse(std::string_view content, std::string_view sourceName = "string");
    static Result<Registry> load(const std::filesystem::path& path);

    void addEvent(HandlerDescriptor descriptor);

    const std::vector<HandlerDescriptor>& events() const;

    // Descriptors whose type matches, in registry order.
    std::vector<HandlerDescriptor> lookup(std::string_view type) const;

    // Distinct event types in first-seen order.
    std::vector<std::string> eventTypes() const;

    const toml::table& data() const;
    void setData(toml::table data);

  private:
    std::vector<HandlerDescriptor> events_;
    toml::table data_;
};

} // namespace fleet
