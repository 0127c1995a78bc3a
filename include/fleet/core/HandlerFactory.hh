#pragma once

#include "fleet/core/Handler.hh"
#include "fleet/core/Registry.hh"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleet {

using HandlerConstructor = std::function<std::unique_ptr<Handler>()>;

// Table of named handler constructors, filled once at startup. Registry
// descriptors name a class (and optionally a path); the factory turns them
// into fresh Handler instances.
//
// A registration with a path is stored under "<path>/<className>" with the
// path's surrounding slashes trimmed. Resolving a descriptor that carries a
// path tries that qualified key first and falls back to the bare class name.
class HandlerFactory {
  public:
    HandlerFactory() = default;

    HandlerFactory(const HandlerFactory&) = delete;
    HandlerFactory& operator=(const HandlerFactory&) = delete;

    // Throws FleetException on an empty name, null constructor or duplicate key.
    void registerHandler(const std::string& className, const HandlerConstructor& constructor,
                         const std::optional<std::string>& path = std::nullopt);

    bool unregisterHandler(const std::string& className, const std::optional<std::string>& path = std::nullopt);

    bool canResolve(const HandlerDescriptor& descriptor) const;

    // Throws HandlerResolutionException when nothing is registered for the
    // descriptor or its constructor returns null.
    std::unique_ptr<Handler> create(const HandlerDescriptor& descriptor) const;

    std::vector<std::string> getRegisteredNames() const;
    std::size_t size() const;
    void clear();

    static std::string qualifiedName(const std::string& className, const std::optional<std::string>& path);

  private:
    const HandlerConstructor* find(const HandlerDescriptor& descriptor) const;

    mutable std::mutex factoryMutex;
    std::unordered_map<std::string, HandlerConstructor> constructors;
};

#define FLEET_REGISTER_HANDLER(factory, HandlerClass)                                                                  \
    (factory).registerHandler(#HandlerClass,                                                                           \
                              []() -> std::unique_ptr<fleet::Handler> { return std::make_unique<HandlerClass>(); })

} // namespace fleet
