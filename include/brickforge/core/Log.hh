#pragma once

// Brickforge Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "brickforge/core/Log.hh"
//   BRICKFORGE_LOG_INFO("Plugin {} registered", name);
//   BRICKFORGE_LOG_ERROR("Failed to initialize plugin {}: {}", name, reason);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace brickforge::log {

/// Initialize the logging subsystem (console output only).
/// Call once at startup before any logging.
void init();

/// Initialize with a file sink in addition to the console.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Valid after init().
quill::Logger* logger();

/// Logger used by the plugin subsystem. Falls back to the root logger.
quill::Logger* pluginLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);

} // namespace brickforge::log

// Brickforge logging macros - wrap Quill with the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define BRICKFORGE_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(brickforge::log::logger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(brickforge::log::logger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(brickforge::log::logger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(brickforge::log::logger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(brickforge::log::logger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(brickforge::log::logger(), fmt, ##__VA_ARGS__)

// Plugin channel: lifecycle transitions, budgets and effect hooks.
#define BRICKFORGE_PLUGIN_DEBUG(fmt, ...) QUILL_LOG_DEBUG(brickforge::log::pluginLogger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_PLUGIN_INFO(fmt, ...) QUILL_LOG_INFO(brickforge::log::pluginLogger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_PLUGIN_WARN(fmt, ...) QUILL_LOG_WARNING(brickforge::log::pluginLogger(), fmt, ##__VA_ARGS__)
#define BRICKFORGE_PLUGIN_ERROR(fmt, ...) QUILL_LOG_ERROR(brickforge::log::pluginLogger(), fmt, ##__VA_ARGS__)
