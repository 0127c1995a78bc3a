#include "fleet/core/Config.hh"

#include "fleet/core/DataLoader.hh"
#include "fleet/core/Log.hh"

namespace fleet {

namespace {

std::filesystem::path resolvePath(const std::filesystem::path& baseDir, const std::string& value) {
    std::filesystem::path path(value);
    if (path.is_relative() && !baseDir.empty()) {
        return baseDir / path;
    }
    return path;
}

} // namespace

Result<Config> Config::fromLoader(const DataLoader& loader, const std::filesystem::path& baseDir) {
    Config config;

    if (loader.hasKey("registry.path")) {
        auto path = loader.getString("registry.path");
        if (path.isError()) {
            return Result<Config>::error(path.code(), path.message());
        }
        config.registryPath = resolvePath(baseDir, path.value());
    }

    auto stopOnFailure = loader.getBoolOr("dispatch.stop_on_first_failure", config.dispatch.stopOnFirstFailure);
    if (stopOnFailure.isError()) {
        return Result<Config>::error(stopOnFailure.code(), stopOnFailure.message());
    }
    config.dispatch.stopOnFirstFailure = stopOnFailure.value();

    auto maxHandlers =
        loader.getIntOr("dispatch.max_handlers", static_cast<int64_t>(config.dispatch.maxHandlers));
    if (maxHandlers.isError()) {
        return Result<Config>::error(maxHandlers.code(), maxHandlers.message());
    }
    if (maxHandlers.value() < 0) {
        return Result<Config>::error(ErrorCode::InvalidArgument,
                                     loader.sourceName() + ": key 'dispatch.max_handlers' must not be negative");
    }
    config.dispatch.maxHandlers = static_cast<std::size_t>(maxHandlers.value());

    auto level = loader.getStringOr("log.level", config.logLevel);
    if (level.isError()) {
        return Result<Config>::error(level.code(), level.message());
    }
    auto parsedLevel = log::parseLevel(level.value());
    if (parsedLevel.isError()) {
        return Result<Config>::error(parsedLevel.code(), loader.sourceName() + ": " + parsedLevel.message());
    }
    config.logLevel = level.value();

    return Result<Config>::ok(std::move(config));
}

Result<Config> Config::parse(std::string_view content, std::string_view sourceName) {
    auto loader = DataLoader::parse(content, sourceName);
    if (loader.isError()) {
        return Result<Config>::error(loader.code(), loader.message());
    }
    return fromLoader(loader.value());
}

Result<Config> Config::load(const std::filesystem::path& path) {
    auto loader = DataLoader::load(path);
    if (loader.isError()) {
        return Result<Config>::error(loader.code(), loader.message());
    }
    FLEET_LOG_INFO("Loaded configuration from {}", path.string());
    return fromLoader(loader.value(), path.parent_path());
}

} // namespace fleet
