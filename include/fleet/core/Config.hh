#pragma once

#include "fleet/core/Dispatcher.hh"
#include "fleet/utils/ErrorHandling.hh"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fleet {

class DataLoader;

// Process configuration read from TOML:
//
//   [registry]
//   path = "registry.toml"        # relative to the config file
//
//   [dispatch]
//   stop_on_first_failure = false
//   max_handlers = 10000          # 0 disables the bound
//
//   [log]
//   level = "info"
//
// Every key is optional; a present key of the wrong type is an error.
struct Config {
    std::optional<std::filesystem::path> registryPath;
    DispatchPolicy dispatch;
    std::string logLevel = "info";

    // Relative paths are resolved against baseDir.
    static Result<Config> fromLoader(const DataLoader& loader, const std::filesystem::path& baseDir = {});
    static Result<Config> parse(std::string_view content, std::string_view sourceName = "string");
    static Result<Config> load(const std::filesystem::path& path);
};

} // namespace fleet
