#include "fleet/core/HandlerFactory.hh"
#include "fleet/core/Log.hh"
#include "fleet/utils/ErrorHandling.hh"
#include "fleet/utils/Utils.hh"

#include <algorithm>

namespace fleet {

std::string HandlerFactory::qualifiedName(const std::string& className, const std::optional<std::string>& path) {
    if (!path) {
        return className;
    }
    auto trimmed = Utils::trim(*path, '/');
    if (trimmed.empty()) {
        return className;
    }
    return std::string(trimmed) + "/" + className;
}

void HandlerFactory::registerHandler(const std::string& className, const HandlerConstructor& constructor,
                                     const std::optional<std::string>& path) {
    if (className.empty()) {
        throwError("Handler class name cannot be empty");
    }

    if (!constructor) {
        throwError("Handler constructor for '" + className + "' cannot be null");
    }

    auto key = qualifiedName(className, path);

    std::lock_guard<std::mutex> lock(factoryMutex);
    if (constructors.find(key) != constructors.end()) {
        throwError("Handler '" + key + "' is already registered");
    }

    constructors.emplace(key, constructor);
    FLEET_LOG_DEBUG("Registered handler '{}'", key);
}

bool HandlerFactory::unregisterHandler(const std::string& className, const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(factoryMutex);
    return constructors.erase(qualifiedName(className, path)) > 0;
}

const HandlerConstructor* HandlerFactory::find(const HandlerDescriptor& descriptor) const {
    if (descriptor.path) {
        auto it = constructors.find(qualifiedName(descriptor.className, descriptor.path));
        if (it != constructors.end()) {
            return &it->second;
        }
    }

    auto it = constructors.find(descriptor.className);
    if (it != constructors.end()) {
        return &it->second;
    }
    return nullptr;
}

bool HandlerFactory::canResolve(const HandlerDescriptor& descriptor) const {
    std::lock_guard<std::mutex> lock(factoryMutex);
    return find(descriptor) != nullptr;
}

std::unique_ptr<Handler> HandlerFactory::create(const HandlerDescriptor& descriptor) const {
    HandlerConstructor constructor;
    {
        std::lock_guard<std::mutex> lock(factoryMutex);
        const auto* found = find(descriptor);
        if (found) {
            constructor = *found;
        }
    }

    auto key = qualifiedName(descriptor.className, descriptor.path);
    if (!constructor) {
        FLEET_LOG_ERROR("No handler registered for '{}' (event type '{}')", key, descriptor.type);
        throw HandlerResolutionException("Handler class '" + key + "' for event type '" + descriptor.type +
                                         "' could not be resolved");
    }

    auto handler = constructor();
    if (!handler) {
        FLEET_LOG_ERROR("Constructor for handler '{}' returned null", key);
        throw HandlerResolutionException("Handler constructor for '" + key + "' returned null");
    }
    return handler;
}

std::vector<std::string> HandlerFactory::getRegisteredNames() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(factoryMutex);
        names.reserve(constructors.size());
        for (const auto& [name, ctor] : constructors) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t HandlerFactory::size() const {
    std::lock_guard<std::mutex> lock(factoryMutex);
    return constructors.size();
}

void HandlerFactory::clear() {
    std::lock_guard<std::mutex> lock(factoryMutex);
    constructors.clear();
}

} // namespace fleet
