#pragma once

#include "brickforge/core/Plugin.hh"
#include "brickforge/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <string_view>

namespace brickforge {

// Reads PluginManagerConfig from the [plugins] table of a TOML document:
//
//   [plugins]
//   performance_monitoring = true
//   max_execution_time_per_frame_ms = 2.0
//   execution_timeout_ms = 5000
//
// Absent keys (or an absent table) keep their defaults. A key of the wrong
// type or a non-positive duration is InvalidState.
Result<PluginManagerConfig> pluginManagerConfigFromTable(const toml::table& root, std::string_view sourceName);

// Parse error is ParseError with "source:line:column - description".
Result<PluginManagerConfig> parsePluginManagerConfig(std::string_view content, std::string_view sourceName = "string");

// NotFound when the file does not exist.
Result<PluginManagerConfig> loadPluginManagerConfig(const std::filesystem::path& path);

} // namespace brickforge
