#pragma once

#include "fleet/core/Config.hh"
#include "fleet/core/HandlerFactory.hh"
#include "fleet/core/Registry.hh"
#include "fleet/utils/ErrorHandling.hh"

#include <memory>
#include <mutex>
#include <optional>

namespace fleet {

// Process-wide defaults behind Event::create(): the configuration, the
// handler factory filled at startup, and a lazily loaded registry.
//
// The registry is read from config.registryPath on first use and cached
// until configure(), setRegistry() or reset() replaces it. Without a
// configured path it is empty. Events copy it, so later reloads never
// affect an event already constructed.
class Platform {
  public:
    static Platform& instance();

    Platform();

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    void configure(Config config);
    Config getConfig() const;

    Result<Registry> getRegistry();
    void setRegistry(Registry registry);

    std::shared_ptr<HandlerFactory> getHandlerFactory() const;

    // Drops configuration, cached registry and every registered handler.
    void reset();

  private:
    mutable std::mutex platformMutex;
    Config config;
    std::optional<Registry> registry;
    std::shared_ptr<HandlerFactory> handlerFactory;
};

} // namespace fleet
