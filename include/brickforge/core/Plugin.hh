#pragma once

#include "brickforge/core/StateMachine.hh"
#include "brickforge/utils/ErrorHandling.hh"

#include <asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace brickforge {

class GameState;

// Advisory time budget of one invocation. maxExecutionTime is in
// milliseconds; 0 means unbounded.
struct PerformanceBudget {
    std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();
    double maxExecutionTime = 0.0;

    double elapsedMs() const;
    bool exhausted() const;
};

// Per-call value object handed to plugin methods. The manager fills in
// `performance` before each invocation.
struct ExecutionContext {
    virtual ~ExecutionContext() = default;

    GameState* gameState = nullptr;
    double deltaTime = 0.0;
    double currentTime = 0.0;
    PerformanceBudget performance;
};

// Closed set of operations the manager can dispatch to a plugin.
enum class PluginMethod : uint8_t {
    Update,
    Reset,
    ApplyEffect,
    RemoveEffect,
    UpdateEffect
};

std::string pluginMethodToString(PluginMethod method);

using PluginMethodHandler = std::function<void(ExecutionContext&)>;
using PluginMethodTable = std::unordered_map<PluginMethod, PluginMethodHandler>;

class Plugin {
  public:
    virtual ~Plugin() = default;

    virtual std::string getName() const = 0;
    virtual std::string getVersion() const = 0;
    virtual std::string getDescription() const { return {}; }

    virtual std::vector<std::string> getDependencies() const { return {}; }

    // Lifecycle coroutines. Synchronous plugins simply co_return.
    virtual asio::awaitable<void> init() = 0;
    virtual asio::awaitable<void> destroy() = 0;

    // Operations executePlugin may invoke. Read once at registration.
    virtual PluginMethodTable methods() { return {}; }
};

enum class PluginStatus : uint8_t {
    Registered,
    Initializing,
    Active,
    Error,
    Destroyed
};

std::string pluginStatusToString(PluginStatus status);

struct PluginMetrics {
    double initTime = 0.0;
    double lastExecutionTime = 0.0;
    double totalExecutionTime = 0.0;
    uint32_t errorCount = 0;
    uint64_t executionCount = 0;
    std::optional<std::string> lastError;
    std::optional<ErrorCode> lastErrorCode;
};

// Snapshot of one registry entry, as returned to callers.
struct PluginMetadata {
    std::shared_ptr<Plugin> plugin;
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> dependencies;
    PluginStatus status = PluginStatus::Registered;
    PluginMetrics metrics;
};

struct PluginExecutionResult {
    bool success = false;
    double executionTime = 0.0;
    std::optional<std::string> error;
    std::optional<ErrorCode> errorCode;
    bool exceededBudget = false;
};

struct PluginManagerConfig {
    bool performanceMonitoring = true;
    double maxExecutionTimePerFrame = 2.0; // ms
    double executionTimeout = 5000.0;      // ms
};

struct PerformanceStats {
    std::size_t totalPlugins = 0;
    std::size_t activePlugins = 0;
    double averageExecutionTime = 0.0;
    double totalExecutionTime = 0.0;
    std::vector<std::string> pluginsExceedingBudget;
};

// Outcome of initializeAll / destroyAll, in processing order.
struct BatchReport {
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;

    std::size_t attempted() const { return succeeded.size() + failed.size(); }
    bool allSucceeded() const { return failed.empty(); }
};

/// Registry, dependency resolver and execution sandbox for plugins.
///
/// Owned by a game session; single-threaded. Lifecycle coroutines run on the
/// executor of whoever awaits them, and the manager must outlive them.
/// Failures of a single plugin are reported through return values and
/// PluginMetrics, never as exceptions.
class PluginManager {
  public:
    explicit PluginManager(PluginManagerConfig config = {});

    /// Admit a plugin in Registered state. False on invalid shape, duplicate
    /// name or a dependency that is not registered yet; the registry is left
    /// untouched in that case.
    bool registerPlugin(std::shared_ptr<Plugin> plugin);

    /// Remove a plugin that is not Active or Initializing.
    bool unregisterPlugin(const std::string& name);

    /// Run init() raced against executionTimeout. A timeout does not stop
    /// the init coroutine; the plugin is marked Error regardless of how it
    /// eventually finishes.
    asio::awaitable<bool> initializePlugin(std::string name);

    /// Initialize every plugin in dependency order, continuing past failures.
    /// DependencyCycle error before any init runs if no order exists.
    asio::awaitable<Result<BatchReport>> initializeAll();

    PluginExecutionResult executePlugin(const std::string& name, PluginMethod method,
                                        ExecutionContext* context = nullptr);

    asio::awaitable<bool> destroyPlugin(std::string name);

    /// Destroy every Active plugin in reverse dependency order.
    asio::awaitable<BatchReport> destroyAll();

    std::shared_ptr<Plugin> getPlugin(const std::string& name) const;

    /// True only when the plugin exists and is Active.
    bool hasPlugin(const std::string& name) const;

    std::optional<PluginMetadata> getPluginMetadata(const std::string& name) const;
    std::vector<std::string> getPluginNames() const;
    PerformanceStats getPerformanceStats() const;

    /// Depth-first postorder over registration order: dependencies first.
    Result<std::vector<std::string>> resolveDependencyOrder() const;

    const PluginManagerConfig& config() const { return config_; }

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

  private:
    struct PluginEntry {
        std::shared_ptr<Plugin> plugin;
        std::string version;
        std::string description;
        std::vector<std::string> dependencies;
        PluginMethodTable methods;
        StateMachine<PluginStatus> status;
        PluginMetrics metrics;
        bool busy = false; // init or destroy in flight
    };

    Result<void> admit(const std::string& name, const std::string& version,
                       const std::vector<std::string>& dependencies) const;
    Result<void> visit(const std::string& name, std::unordered_set<std::string>& visiting,
                       std::unordered_set<std::string>& visited, std::vector<std::string>& order) const;
    void recordFailure(PluginEntry& entry, ErrorCode code, const std::string& message);
    std::chrono::steady_clock::duration timeoutDuration() const;

    PluginManagerConfig config_;
    std::unordered_map<std::string, PluginEntry> plugins_;
    std::vector<std::string> registrationOrder_;
};

} // namespace brickforge
