#include "fleet/core/Constants.g.hh"
#include "fleet/core/Context.hh"
#include "fleet/core/Event.hh"
#include "fleet/core/JsonTypes.hh"
#include "fleet/core/Log.hh"
#include "fleet/core/Platform.hh"
#include "fleet/handlers/OutputHandler.hh"
#include "fleet/parser/ArgumentParser.hh"

#include <nlohmann/json.hpp>

#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPartialFailure = 1;
constexpr int kExitError = 2;

std::optional<int64_t> parseId(const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

int runEvent(const fleet::ArgumentParser& args) {
    auto& platform = fleet::Platform::instance();

    if (args.hasArgument("--config")) {
        auto config = fleet::Config::load(args.getValue("--config"));
        if (config.isError()) {
            FLEET_LOG_CRITICAL("Invalid configuration: {}", config.message());
            std::cerr << "error: " << config.message() << std::endl;
            return kExitError;
        }
        fleet::log::setLevel(fleet::log::parseLevel(config.value().logLevel).value());
        platform.configure(std::move(config.value()));
    }

    fleet::registerBuiltinHandlers(*platform.getHandlerFactory());

    auto type = args.getValue("--event");
    if (type.empty()) {
        std::cerr << "error: --event is required" << std::endl;
        return kExitError;
    }

    fleet::Context context;
    for (const auto& assignment : args.getValues("--set")) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "error: --set expects key=value, got '" << assignment << "'" << std::endl;
            return kExitError;
        }
        context.set(assignment.substr(0, eq), assignment.substr(eq + 1));
    }

    std::optional<fleet::Site> site;
    if (args.hasArgument("--site-id")) {
        auto id = parseId(args.getValue("--site-id"));
        if (!id) {
            std::cerr << "error: --site-id must be an integer" << std::endl;
            return kExitError;
        }
        site = fleet::Site{*id, args.getValue("--site-name"), args.getValue("--site-url"), {}};
    }

    auto event = fleet::Event::create(type, std::move(context), std::make_shared<fleet::StreamOutput>(std::cout),
                                      std::move(site));
    auto summary = event->run();

    std::cout << "Event '" << type << "': " << summary.executed << " executed, " << summary.completed
              << " completed, " << summary.failed << " failed" << (summary.halted ? " (halted)" : "") << std::endl;

    if (args.hasArgument("--json")) {
        nlohmann::json snapshot = event->debug();
        std::cout << snapshot.dump(2) << std::endl;
    }

    return summary.ok() ? kExitOk : kExitPartialFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    fleet::ArgumentParser argParser;
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--help", "Display help information");
    argParser.addArgument("--config", "TOML configuration file", true);
    argParser.addArgument("--event", "Event type to run", true);
    argParser.addArgument("--set", "Context entry key=value (repeatable)", true);
    argParser.addArgument("--site-id", "Target site id", true);
    argParser.addArgument("--site-name", "Target site name", true);
    argParser.addArgument("--site-url", "Target site URL", true);
    argParser.addArgument("--log-file", "Additional log file", true);
    argParser.addArgument("--json", "Print the handler snapshot as JSON");

    auto parsed = argParser.parse(argc, argv);
    if (parsed.isError()) {
        std::cerr << "error: " << parsed.message() << std::endl;
        std::cerr << argParser.usage(fleet::APP_EXECUTABLE_NAME);
        return kExitError;
    }

    if (argParser.hasArgument("--version")) {
        std::cout << fleet::APP_NAME << " version " << fleet::APP_VERSION << std::endl;
        return kExitOk;
    }

    if (argParser.hasArgument("--help")) {
        std::cout << argParser.usage(fleet::APP_EXECUTABLE_NAME);
        return kExitOk;
    }

    if (argParser.hasArgument("--log-file")) {
        auto logFile = argParser.getValue("--log-file");
        fleet::log::init(logFile.c_str());
    } else {
        fleet::log::init();
    }
    FLEET_LOG_INFO("Starting {} {}", fleet::APP_NAME, fleet::APP_VERSION);

    int exitCode = kExitOk;
    try {
        exitCode = runEvent(argParser);
    } catch (const fleet::FleetException& e) {
        FLEET_LOG_CRITICAL("Event run aborted: {}", e.what());
        std::cerr << "error: " << e.what() << std::endl;
        exitCode = kExitError;
    } catch (const std::exception& e) {
        FLEET_LOG_CRITICAL("Unexpected error: {}", e.what());
        std::cerr << "error: " << e.what() << std::endl;
        exitCode = kExitError;
    }

    fleet::log::shutdown();
    return exitCode;
}
