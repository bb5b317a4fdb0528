#include "brickforge/core/PluginConfig.hh"
#include "brickforge/core/Log.hh"

#include <sstream>
#include <string>

namespace brickforge {

namespace {

constexpr std::string_view kPluginsTable = "plugins";

std::string formatError(std::string_view sourceName, std::string_view key, std::string_view problem) {
    std::ostringstream oss;
    oss << sourceName << ": key '" << kPluginsTable << "." << key << "' " << problem;
    return oss.str();
}

Result<bool> readBool(const toml::table& table, std::string_view key, bool defaultValue,
                      std::string_view sourceName) {
    const auto* node = table.get(key);
    if (!node) {
        return Result<bool>::ok(defaultValue);
    }
    if (auto val = node->as_boolean()) {
        return Result<bool>::ok(val->get());
    }
    return Result<bool>::error(ErrorCode::InvalidState, formatError(sourceName, key, "is not a boolean"));
}

// Accepts integers as well as floats; rejects zero and negative values.
Result<double> readPositiveMs(const toml::table& table, std::string_view key, double defaultValue,
                              std::string_view sourceName) {
    const auto* node = table.get(key);
    if (!node) {
        return Result<double>::ok(defaultValue);
    }

    double value = 0.0;
    if (auto val = node->as_floating_point()) {
        value = val->get();
    } else if (auto val = node->as_integer()) {
        value = static_cast<double>(val->get());
    } else {
        return Result<double>::error(ErrorCode::InvalidState, formatError(sourceName, key, "is not a number"));
    }

    if (!(value > 0.0)) {
        return Result<double>::error(ErrorCode::InvalidState, formatError(sourceName, key, "must be positive"));
    }
    return Result<double>::ok(value);
}

std::string describeParseError(std::string_view sourceName, const toml::parse_error& err) {
    std::ostringstream oss;
    oss << sourceName << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
        << err.description();
    return oss.str();
}

} // namespace

Result<PluginManagerConfig> pluginManagerConfigFromTable(const toml::table& root, std::string_view sourceName) {
    PluginManagerConfig config;

    const auto* node = root.get(kPluginsTable);
    if (!node) {
        BRICKFORGE_LOG_DEBUG("{}: no [plugins] table, using defaults", sourceName);
        return Result<PluginManagerConfig>::ok(config);
    }

    const auto* table = node->as_table();
    if (!table) {
        return Result<PluginManagerConfig>::error(ErrorCode::InvalidState,
                                                  std::string(sourceName) + ": 'plugins' is not a table");
    }

    auto monitoring = readBool(*table, "performance_monitoring", config.performanceMonitoring, sourceName);
    if (monitoring.isError()) {
        return monitoring.forward<PluginManagerConfig>();
    }
    auto budget =
        readPositiveMs(*table, "max_execution_time_per_frame_ms", config.maxExecutionTimePerFrame, sourceName);
    if (budget.isError()) {
        return budget.forward<PluginManagerConfig>();
    }
    auto timeout = readPositiveMs(*table, "execution_timeout_ms", config.executionTimeout, sourceName);
    if (timeout.isError()) {
        return timeout.forward<PluginManagerConfig>();
    }

    config.performanceMonitoring = monitoring.value();
    config.maxExecutionTimePerFrame = budget.value();
    config.executionTimeout = timeout.value();
    return Result<PluginManagerConfig>::ok(config);
}

Result<PluginManagerConfig> parsePluginManagerConfig(std::string_view content, std::string_view sourceName) {
    toml::table root;
    try {
        root = toml::parse(content, sourceName);
    } catch (const toml::parse_error& err) {
        return Result<PluginManagerConfig>::error(ErrorCode::ParseError, describeParseError(sourceName, err));
    }
    return pluginManagerConfigFromTable(root, sourceName);
}

Result<PluginManagerConfig> loadPluginManagerConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<PluginManagerConfig>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    const std::string source = path.string();
    toml::table root;
    try {
        root = toml::parse_file(source);
    } catch (const toml::parse_error& err) {
        return Result<PluginManagerConfig>::error(ErrorCode::ParseError, describeParseError(source, err));
    }

    BRICKFORGE_LOG_DEBUG("Loaded plugin config: {}", source);
    return pluginManagerConfigFromTable(root, source);
}

} // namespace brickforge
