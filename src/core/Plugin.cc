#include "brickforge/core/Plugin.hh"
#include "brickforge/core/Async.hh"
#include "brickforge/core/Log.hh"
#include "brickforge/utils/Profiler.hh"

#include <algorithm>
#include <utility>

namespace brickforge {

namespace {

ErrorCode settlementErrorCode(async::Settlement settlement) {
    return settlement == async::Settlement::TimedOut ? ErrorCode::Timeout : ErrorCode::ExecutionFailed;
}

const StateMachine<PluginStatus>::TransitionTable& pluginStatusTransitions() {
    static const StateMachine<PluginStatus>::TransitionTable table = {
        {PluginStatus::Registered, PluginStatus::Initializing},
        {PluginStatus::Initializing, PluginStatus::Active},
        {PluginStatus::Initializing, PluginStatus::Error},
        {PluginStatus::Active, PluginStatus::Destroyed},
        {PluginStatus::Active, PluginStatus::Error},
        {PluginStatus::Error, PluginStatus::Initializing},
        {PluginStatus::Error, PluginStatus::Destroyed},
        {PluginStatus::Destroyed, PluginStatus::Initializing},
    };
    return table;
}

// Coroutine parameters live in the frame, so the plugin outlives a
// timed-out race.
asio::awaitable<void> runInit(std::shared_ptr<Plugin> plugin) {
    co_await plugin->init();
}

asio::awaitable<void> runDestroy(std::shared_ptr<Plugin> plugin) {
    co_await plugin->destroy();
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

} // namespace

double PerformanceBudget::elapsedMs() const {
    return async::elapsedMs(startTime);
}

bool PerformanceBudget::exhausted() const {
    return maxExecutionTime > 0.0 && elapsedMs() > maxExecutionTime;
}

std::string pluginMethodToString(PluginMethod method) {
    switch (method) {
        case PluginMethod::Update:
            return "update";
        case PluginMethod::Reset:
            return "reset";
        case PluginMethod::ApplyEffect:
            return "applyEffect";
        case PluginMethod::RemoveEffect:
            return "removeEffect";
        case PluginMethod::UpdateEffect:
            return "updateEffect";
    }
    return "unknown";
}

std::string pluginStatusToString(PluginStatus status) {
    switch (status) {
        case PluginStatus::Registered:
            return "registered";
        case PluginStatus::Initializing:
            return "initializing";
        case PluginStatus::Active:
            return "active";
        case PluginStatus::Error:
            return "error";
        case PluginStatus::Destroyed:
            return "destroyed";
    }
    return "unknown";
}

PluginManager::PluginManager(PluginManagerConfig config) : config_(std::move(config)) {}

Result<void> PluginManager::admit(const std::string& name, const std::string& version,
                                  const std::vector<std::string>& dependencies) const {
    if (name.empty()) {
        return Result<void>::error(ErrorCode::InvalidArgument, "Plugin name cannot be empty");
    }
    if (version.empty()) {
        return Result<void>::error(ErrorCode::InvalidArgument, "Plugin '" + name + "' has no version");
    }

    for (const auto& dep : dependencies) {
        if (dep.empty()) {
            return Result<void>::error(ErrorCode::InvalidArgument,
                                       "Plugin '" + name + "' declares an empty dependency name");
        }
        if (dep == name) {
            return Result<void>::error(ErrorCode::InvalidArgument, "Plugin '" + name + "' depends on itself");
        }
    }

    if (plugins_.count(name) > 0) {
        return Result<void>::error(ErrorCode::AlreadyExists, "Plugin '" + name + "' is already registered");
    }

    std::vector<std::string> missing;
    for (const auto& dep : dependencies) {
        if (plugins_.count(dep) == 0) {
            missing.push_back(dep);
        }
    }
    if (!missing.empty()) {
        return Result<void>::error(ErrorCode::MissingDependency,
                                   "Plugin '" + name + "' has missing dependencies: " + joinNames(missing));
    }

    return Result<void>::ok();
}

bool PluginManager::registerPlugin(std::shared_ptr<Plugin> plugin) {
    if (!plugin) {
        BRICKFORGE_PLUGIN_ERROR("Failed to register plugin: plugin is null");
        return false;
    }

    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> dependencies;
    PluginMethodTable methods;

    try {
        name = plugin->getName();
        version = plugin->getVersion();
        description = plugin->getDescription();
        dependencies = plugin->getDependencies();
        methods = plugin->methods();
    } catch (const std::exception& e) {
        BRICKFORGE_PLUGIN_ERROR("Failed to inspect plugin: {}", e.what());
        return false;
    }

    auto admitted = admit(name, version, dependencies);
    if (admitted.isError()) {
        BRICKFORGE_PLUGIN_ERROR("Failed to register plugin '{}' ({}): {}", name,
                                errorCodeToString(admitted.code()), admitted.message());
        return false;
    }

    PluginEntry entry{std::move(plugin),
                      version,
                      std::move(description),
                      std::move(dependencies),
                      std::move(methods),
                      StateMachine<PluginStatus>(PluginStatus::Registered, pluginStatusTransitions(),
                                                 pluginStatusToString),
                      PluginMetrics{},
                      false};

    plugins_.emplace(name, std::move(entry));
    registrationOrder_.push_back(name);

    BRICKFORGE_PLUGIN_INFO("Plugin {} v{} registered", name, version);
    return true;
}

bool PluginManager::unregisterPlugin(const std::string& name) {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        BRICKFORGE_PLUGIN_WARN("Plugin '{}' is not registered", name);
        return false;
    }

    const auto status = it->second.status.getState();
    if (it->second.busy || status == PluginStatus::Active || status == PluginStatus::Initializing) {
        BRICKFORGE_PLUGIN_WARN("Cannot unregister plugin '{}' while {}", name, pluginStatusToString(status));
        return false;
    }

    for (const auto& other : registrationOrder_) {
        if (other == name) {
            continue;
        }
        const auto& deps = plugins_.at(other).dependencies;
        if (std::find(deps.begin(), deps.end(), name) != deps.end()) {
            BRICKFORGE_PLUGIN_WARN("Plugin '{}' still depends on unregistered plugin '{}'", other, name);
        }
    }

    plugins_.erase(it);
    registrationOrder_.erase(std::remove(registrationOrder_.begin(), registrationOrder_.end(), name),
                             registrationOrder_.end());

    BRICKFORGE_PLUGIN_INFO("Plugin '{}' unregistered", name);
    return true;
}

asio::awaitable<bool> PluginManager::initializePlugin(std::string name) {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        BRICKFORGE_PLUGIN_ERROR("Plugin '{}' not found", name);
        co_return false;
    }

    // Entries are never erased while busy, so the reference survives the await.
    auto& entry = it->second;
    const auto status = entry.status.getState();

    if (status == PluginStatus::Active) {
        BRICKFORGE_PLUGIN_WARN("Plugin '{}' is already active", name);
        co_return true;
    }
    if (status == PluginStatus::Initializing || entry.busy) {
        BRICKFORGE_PLUGIN_WARN("Plugin '{}' is already initializing", name);
        co_return false;
    }

    auto transition = entry.status.tryTransition(PluginStatus::Initializing);
    if (transition.isError()) {
        BRICKFORGE_PLUGIN_ERROR("Cannot initialize plugin '{}': {}", name, transition.message());
        co_return false;
    }

    BRICKFORGE_PLUGIN_DEBUG("Initializing plugin '{}'", name);

    entry.busy = true;
    auto outcome =
        co_await async::runWithTimeout(runInit(entry.plugin), timeoutDuration(), "Plugin '" + name + "' init");
    entry.busy = false;

    if (!outcome.ok()) {
        BRICKFORGE_PLUGIN_ERROR("Failed to initialize plugin '{}': {}", name, outcome.error);
        recordFailure(entry, settlementErrorCode(outcome.settlement), outcome.error);
        co_return false;
    }

    entry.metrics.initTime = outcome.elapsedMs;
    entry.status.setState(PluginStatus::Active);
    BRICKFORGE_PLUGIN_INFO("Plugin '{}' initialized in {:.2f}ms", name, outcome.elapsedMs);
    co_return true;
}

asio::awaitable<Result<BatchReport>> PluginManager::initializeAll() {
    auto order = resolveDependencyOrder();
    if (order.isError()) {
        BRICKFORGE_PLUGIN_ERROR("Cannot initialize plugins: {}", order.message());
        co_return order.forward<BatchReport>();
    }

    BatchReport report;
    for (const auto& name : order.value()) {
        if (co_await initializePlugin(name)) {
            report.succeeded.push_back(name);
        } else {
            report.failed.push_back(name);
        }
    }

    BRICKFORGE_PLUGIN_INFO("Plugin initialization complete: {} attempted, {} succeeded, {} failed",
                           report.attempted(), report.succeeded.size(), report.failed.size());
    co_return Result<BatchReport>::ok(std::move(report));
}

PluginExecutionResult PluginManager::executePlugin(const std::string& name, PluginMethod method,
                                                   ExecutionContext* context) {
    BRICKFORGE_ZONE_SCOPED_N("PluginManager::executePlugin");

    PluginExecutionResult result;

    auto it = plugins_.find(name);
    if (it == plugins_.end() || it->second.status.getState() != PluginStatus::Active) {
        result.error = "Plugin " + name + " not active";
        result.errorCode = it == plugins_.end() ? ErrorCode::NotFound : ErrorCode::InvalidState;
        return result;
    }

    auto& entry = it->second;
    auto handler = entry.methods.find(method);
    if (handler == entry.methods.end() || !handler->second) {
        result.error = "Method " + pluginMethodToString(method) + " not found in plugin " + name;
        result.errorCode = ErrorCode::NotFound;
        BRICKFORGE_PLUGIN_WARN("{}", *result.error);
        return result;
    }

    ExecutionContext fallback;
    ExecutionContext& ctx = context ? *context : fallback;

    const auto start = std::chrono::steady_clock::now();
    ctx.performance.startTime = start;
    ctx.performance.maxExecutionTime = config_.maxExecutionTimePerFrame;

    try {
        handler->second(ctx);
    } catch (const std::exception& e) {
        result.error = e.what();
    } catch (...) {
        result.error = "unknown error";
    }

    result.executionTime = async::elapsedMs(start);
    result.exceededBudget = result.executionTime > config_.maxExecutionTimePerFrame;

    if (result.error) {
        result.errorCode = ErrorCode::ExecutionFailed;
        entry.metrics.errorCount++;
        entry.metrics.lastError = result.error;
        entry.metrics.lastErrorCode = result.errorCode;
        BRICKFORGE_PLUGIN_ERROR("Plugin '{}' failed in {}: {}", name, pluginMethodToString(method), *result.error);
        return result;
    }

    result.success = true;
    entry.metrics.lastExecutionTime = result.executionTime;
    entry.metrics.totalExecutionTime += result.executionTime;
    entry.metrics.executionCount++;

    if (result.exceededBudget && config_.performanceMonitoring) {
        BRICKFORGE_PLUGIN_WARN("Plugin '{}' exceeded time budget: {:.2f}ms > {:.2f}ms", name, result.executionTime,
                               config_.maxExecutionTimePerFrame);
    }

    BRICKFORGE_PLOT("plugin execution ms", result.executionTime);
    return result;
}

asio::awaitable<bool> PluginManager::destroyPlugin(std::string name) {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        BRICKFORGE_PLUGIN_ERROR("Plugin '{}' not found", name);
        co_return false;
    }

    auto& entry = it->second;
    const auto status = entry.status.getState();
    if (entry.busy || (status != PluginStatus::Active && status != PluginStatus::Error)) {
        BRICKFORGE_PLUGIN_WARN("Cannot destroy plugin '{}' while {}", name, pluginStatusToString(status));
        co_return false;
    }

    entry.busy = true;
    auto outcome = co_await async::runWithTimeout(runDestroy(entry.plugin), timeoutDuration(),
                                                  "Plugin '" + name + "' destroy");
    entry.busy = false;

    if (!outcome.ok()) {
        BRICKFORGE_PLUGIN_ERROR("Failed to destroy plugin '{}': {}", name, outcome.error);
        recordFailure(entry, settlementErrorCode(outcome.settlement), outcome.error);
        co_return false;
    }

    entry.status.setState(PluginStatus::Destroyed);
    BRICKFORGE_PLUGIN_INFO("Plugin '{}' destroyed", name);
    co_return true;
}

asio::awaitable<BatchReport> PluginManager::destroyAll() {
    std::vector<std::string> teardown;

    auto order = resolveDependencyOrder();
    if (order.isError()) {
        BRICKFORGE_PLUGIN_ERROR("{}; destroying in reverse registration order", order.message());
        teardown.assign(registrationOrder_.rbegin(), registrationOrder_.rend());
    } else {
        teardown.assign(order.value().rbegin(), order.value().rend());
    }

    BatchReport report;
    for (const auto& name : teardown) {
        auto it = plugins_.find(name);
        if (it == plugins_.end() || it->second.status.getState() != PluginStatus::Active) {
            continue;
        }

        if (co_await destroyPlugin(name)) {
            report.succeeded.push_back(name);
        } else {
            report.failed.push_back(name);
        }
    }

    BRICKFORGE_PLUGIN_INFO("Plugin teardown complete: {} destroyed, {} failed", report.succeeded.size(),
                           report.failed.size());
    co_return report;
}

std::shared_ptr<Plugin> PluginManager::getPlugin(const std::string& name) const {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return nullptr;
    }
    return it->second.plugin;
}

bool PluginManager::hasPlugin(const std::string& name) const {
    auto it = plugins_.find(name);
    return it != plugins_.end() && it->second.status.getState() == PluginStatus::Active;
}

std::optional<PluginMetadata> PluginManager::getPluginMetadata(const std::string& name) const {
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return std::nullopt;
    }

    const auto& entry = it->second;
    PluginMetadata metadata;
    metadata.plugin = entry.plugin;
    metadata.name = name;
    metadata.version = entry.version;
    metadata.description = entry.description;
    metadata.dependencies = entry.dependencies;
    metadata.status = entry.status.getState();
    metadata.metrics = entry.metrics;
    return metadata;
}

std::vector<std::string> PluginManager::getPluginNames() const {
    return registrationOrder_;
}

PerformanceStats PluginManager::getPerformanceStats() const {
    PerformanceStats stats;
    stats.totalPlugins = plugins_.size();

    for (const auto& name : registrationOrder_) {
        const auto& entry = plugins_.at(name);
        if (entry.status.getState() == PluginStatus::Active) {
            stats.activePlugins++;
        }
        stats.totalExecutionTime += entry.metrics.totalExecutionTime;
        if (entry.metrics.lastExecutionTime > config_.maxExecutionTimePerFrame) {
            stats.pluginsExceedingBudget.push_back(name);
        }
    }

    if (stats.activePlugins > 0) {
        stats.averageExecutionTime = stats.totalExecutionTime / static_cast<double>(stats.activePlugins);
    }

    return stats;
}

Result<std::vector<std::string>> PluginManager::resolveDependencyOrder() const {
    std::unordered_set<std::string> visiting;
    std::unordered_set<std::string> visited;
    std::vector<std::string> order;
    order.reserve(registrationOrder_.size());

    for (const auto& name : registrationOrder_) {
        auto result = visit(name, visiting, visited, order);
        if (result.isError()) {
            return result.forward<std::vector<std::string>>();
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(order));
}

Result<void> PluginManager::visit(const std::string& name, std::unordered_set<std::string>& visiting,
                                  std::unordered_set<std::string>& visited, std::vector<std::string>& order) const {
    if (visited.count(name) > 0) {
        return Result<void>::ok();
    }
    if (visiting.count(name) > 0) {
        return Result<void>::error(ErrorCode::DependencyCycle, "Circular dependency detected involving '" + name + "'");
    }

    visiting.insert(name);

    for (const auto& dep : plugins_.at(name).dependencies) {
        if (plugins_.count(dep) == 0) {
            BRICKFORGE_PLUGIN_WARN("Plugin '{}' depends on '{}', which is no longer registered", name, dep);
            continue;
        }

        auto result = visit(dep, visiting, visited, order);
        if (result.isError()) {
            return result;
        }
    }

    visiting.erase(name);
    visited.insert(name);
    order.push_back(name);
    return Result<void>::ok();
}

void PluginManager::recordFailure(PluginEntry& entry, ErrorCode code, const std::string& message) {
    entry.status.setState(PluginStatus::Error);
    entry.metrics.errorCount++;
    entry.metrics.lastError = message;
    entry.metrics.lastErrorCode = code;
}

std::chrono::steady_clock::duration PluginManager::timeoutDuration() const {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double, std::milli>(config_.executionTimeout));
}

} // namespace brickforge
