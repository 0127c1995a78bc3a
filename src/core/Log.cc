#include "fleet/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <atomic>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fleet::log {

namespace {
// Root logger
std::atomic<quill::Logger*> g_logger{nullptr};

// Handler lifecycle lines from the dispatcher
std::atomic<quill::Logger*> g_logger_dispatch{nullptr};

std::mutex g_init_mutex;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "FleetLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
    std::filesystem::create_directories(kLogsDir);
}

void createLoggers(std::vector<std::shared_ptr<quill::Sink>> sinks) {
    auto pattern = makePattern();

    // Root logger also gets logs/fleet.log; dispatch shares every other sink.
    auto rootSinks = sinks;
    rootSinks.push_back(makeFileSink(kLogsDir + "/fleet.log"));

    auto* root = quill::Frontend::create_or_get_logger("fleet", std::move(rootSinks), pattern);
    auto* dispatch = quill::Frontend::create_or_get_logger("dispatch", std::move(sinks), pattern);

    for (auto* lg : {root, dispatch}) {
        lg->set_log_level(quill::LogLevel::Info);
    }

    g_logger_dispatch.store(dispatch);
    g_logger.store(root);
}

// Sets up the backend and both loggers once; later calls keep the first setup.
void initOnce(const char* log_file_path) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger.load()) {
        return;
    }

    startBackend();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    std::vector<std::shared_ptr<quill::Sink>> sinks{console_sink};
    if (log_file_path) {
        sinks.push_back(makeFileSink(log_file_path));
    }
    createLoggers(std::move(sinks));
}

} // namespace

void init() {
    initOnce(nullptr);
}

void init(const char* log_file_path) {
    initOnce(log_file_path);
}

void shutdown() {
    for (auto* lg : {g_logger.load(), g_logger_dispatch.load()}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    auto* lg = g_logger.load();
    if (!lg) {
        initOnce(nullptr);
        lg = g_logger.load();
    }
    return lg;
}

quill::Logger* dispatchLogger() {
    auto* lg = g_logger_dispatch.load();
    if (!lg) {
        initOnce(nullptr);
        lg = g_logger_dispatch.load();
    }
    return lg;
}

void setLevel(quill::LogLevel level) {
    for (auto* lg : {logger(), dispatchLogger()}) {
        lg->set_log_level(level);
    }
}

Result<quill::LogLevel> parseLevel(std::string_view name) {
    if (name == "trace")
        return Result<quill::LogLevel>::ok(quill::LogLevel::TraceL1);
    if (name == "debug")
        return Result<quill::LogLevel>::ok(quill::LogLevel::Debug);
    if (name == "info")
        return Result<quill::LogLevel>::ok(quill::LogLevel::Info);
    if (name == "warning" || name == "warn")
        return Result<quill::LogLevel>::ok(quill::LogLevel::Warning);
    if (name == "error")
        return Result<quill::LogLevel>::ok(quill::LogLevel::Error);
    if (name == "critical")
        return Result<quill::LogLevel>::ok(quill::LogLevel::Critical);
    return Result<quill::LogLevel>::error(ErrorCode::InvalidArgument,
                                          "unknown log level '" + std::string(name) + "'");
}

} // namespace fleet::log
