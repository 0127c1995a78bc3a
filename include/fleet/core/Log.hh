#pragma once

// Fleet Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "fleet/core/Log.hh"
//   FLEET_LOG_INFO("Loaded {} handlers for '{}'", count, type);
//   FLEET_DISPATCH_LOG_WARN("Handler {} failed: {}", name, message);

#include "fleet/utils/ErrorHandling.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <string_view>

namespace fleet::log {

/// Initialize the logging subsystem (console + logs/fleet.log).
/// Only the first call takes effect; logging before any call initializes
/// with these defaults.
void init();

/// Initialize with an additional caller-provided file sink.
/// Must run before the first log statement for the file to be attached.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger, initializing with defaults when needed.
quill::Logger* logger();

/// Logger for per-handler dispatch lines, initializing with defaults when needed.
quill::Logger* dispatchLogger();

/// Set runtime log level (within compile-time ceiling) on every logger.
void setLevel(quill::LogLevel level);

/// Map a config string ("debug", "info", "warning", ...) to a level.
Result<quill::LogLevel> parseLevel(std::string_view name);

} // namespace fleet::log

// Fleet logging macros - wrap Quill with the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define FLEET_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(fleet::log::logger(), fmt, ##__VA_ARGS__)
#define FLEET_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(fleet::log::logger(), fmt, ##__VA_ARGS__)
#define FLEET_LOG_INFO(fmt, ...) QUILL_LOG_INFO(fleet::log::logger(), fmt, ##__VA_ARGS__)
#define FLEET_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(fleet::log::logger(), fmt, ##__VA_ARGS__)
#define FLEET_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(fleet::log::logger(), fmt, ##__VA_ARGS__)
#define FLEET_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(fleet::log::logger(), fmt, ##__VA_ARGS__)

#define FLEET_DISPATCH_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(fleet::log::dispatchLogger(), fmt, ##__VA_ARGS__)
#define FLEET_DISPATCH_LOG_INFO(fmt, ...) QUILL_LOG_INFO(fleet::log::dispatchLogger(), fmt, ##__VA_ARGS__)
#define FLEET_DISPATCH_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(fleet::log::dispatchLogger(), fmt, ##__VA_ARGS__)
