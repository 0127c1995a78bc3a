#include "fleet/core/Registry.hh"

#include "fleet/core/DataLoader.hh"
#include "fleet/core/Log.hh"

#include <algorithm>
#include <iterator>

namespace fleet {

Registry::Registry(std::vector<HandlerDescriptor> events) : events_(std::move(events)) {}

Result<Registry> Registry::fromLoader(const DataLoader& loader) {
    Registry registry;

    auto data = loader.table();
    data.erase("events");
    registry.data_ = std::move(data);

    // A registry without an events listing is valid and simply empty.
    if (!loader.hasKey("events")) {
        return Result<Registry>::ok(std::move(registry));
    }

    auto entries = loader.getTableArray("events");
    if (entries.isError()) {
        return Result<Registry>::error(entries.code(), entries.message());
    }

    for (const auto& entry : entries.value()) {
        auto type = entry.getString("type");
        if (type.isError()) {
            return Result<Registry>::error(ErrorCode::InvalidState, type.message());
        }
        auto className = entry.getString("class");
        if (className.isError()) {
            return Result<Registry>::error(ErrorCode::InvalidState, className.message());
        }

        HandlerDescriptor descriptor{type.value(), className.value(), std::nullopt};
        if (entry.hasKey("path")) {
            auto path = entry.getString("path");
            if (path.isError()) {
                return Result<Registry>::error(ErrorCode::InvalidState, path.message());
            }
            if (!path.value().empty()) {
                descriptor.path = path.value();
            }
        }
        registry.events_.push_back(std::move(descriptor));
    }

    FLEET_LOG_DEBUG("Registry '{}' lists {} handler descriptors", loader.sourceName(), registry.events_.size());
    return Result<Registry>::ok(std::move(registry));
}

Result<Registry> Registry::parse(std::string_view content, std::string_view sourceName) {
    auto loader = DataLoader::parse(content, sourceName);
    if (loader.isError()) {
        return Result<Registry>::error(loader.code(), loader.message());
    }
    return fromLoader(loader.value());
}

Result<Registry> Registry::load(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        return Result<Registry>::error(loader.code(), loader.message());
    }
    return fromLoader(loader.value());
}

void Registry::addEvent(HandlerDescriptor descriptor) {
    events_.push_back(std::move(descriptor));
}

const std::vector<HandlerDescriptor>& Registry::events() const {
    return events_;
}

std::vector<HandlerDescriptor> Registry::lookup(std::string_view type) const {
    std::vector<HandlerDescriptor> matches;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matches),
                 [type](const HandlerDescriptor& d) { return d.type == type; });
    return matches;
}

std::vector<std::string> Registry::eventTypes() const {
    std::vector<std::string> types;
    for (const auto& descriptor : events_) {
        if (std::find(types.begin(), types.end(), descriptor.type) == types.end()) {
            types.push_back(descriptor.type);
        }
    }
    return types;
}

const toml::table& Registry::data() const {
    return data_;
}

void Registry::setData(toml::table data) {
    data.erase("events");
    data_ = std::move(data);
}

} // namespace fleet
