#include "fleet/core/Platform.hh"
#include "fleet/core/Log.hh"

namespace fleet {

Platform& Platform::instance() {
    static Platform platform;
    return platform;
}

Platform::Platform() : handlerFactory(std::make_shared<HandlerFactory>()) {}

void Platform::configure(Config config) {
    std::lock_guard<std::mutex> lock(platformMutex);
    this->config = std::move(config);
    registry.reset();
}

Config Platform::getConfig() const {
    std::lock_guard<std::mutex> lock(platformMutex);
    return config;
}

Result<Registry> Platform::getRegistry() {
    std::lock_guard<std::mutex> lock(platformMutex);

    if (!registry) {
        if (!config.registryPath) {
            registry = Registry();
        } else {
            auto loaded = Registry::load(*config.registryPath);
            if (loaded.isError()) {
                return Result<Registry>::error(loaded.code(), loaded.message());
            }
            FLEET_LOG_INFO("Loaded registry {} ({} descriptors)", config.registryPath->string(),
                           loaded.value().events().size());
            registry = std::move(loaded.value());
        }
    }

    return Result<Registry>::ok(*registry);
}

void Platform::setRegistry(Registry registry) {
    std::lock_guard<std::mutex> lock(platformMutex);
    this->registry = std::move(registry);
}

std::shared_ptr<HandlerFactory> Platform::getHandlerFactory() const {
    std::lock_guard<std::mutex> lock(platformMutex);
    return handlerFactory;
}

void Platform::reset() {
    std::lock_guard<std::mutex> lock(platformMutex);
    config = Config();
    registry.reset();
    handlerFactory->clear();
}

} // namespace fleet
