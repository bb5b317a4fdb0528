#include "brickforge/core/Async.hh"
#include "brickforge/core/Plugin.hh"
#include "brickforge/utils/ErrorHandling.hh"
#include "brickforge/utils/Testing.hh"
#include <asio/io_context.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace brickforge;
using namespace brickforge::Testing;

class TestPlugin : public Plugin {
  public:
    TestPlugin(std::string name, std::vector<std::string> deps = {}, std::vector<std::string>* journal = nullptr)
        : name_(std::move(name)), dependencies_(std::move(deps)), journal_(journal) {}

    std::string getName() const override { return name_; }
    std::string getVersion() const override { return version; }
    std::string getDescription() const override { return "Plugin used by the manager tests"; }
    std::vector<std::string> getDependencies() const override { return dependencies_; }

    asio::awaitable<void> init() override {
        if (initDelay.count() > 0) {
            co_await delayFor(initDelay);
        }
        if (failInit) {
            throw std::runtime_error("init failed");
        }
        initCount++;
        if (journal_) {
            journal_->push_back("init:" + name_);
        }
    }

    asio::awaitable<void> destroy() override {
        if (failDestroy) {
            throw std::runtime_error("destroy failed");
        }
        destroyCount++;
        if (journal_) {
            journal_->push_back("destroy:" + name_);
        }
        co_return;
    }

    PluginMethodTable methods() override {
        PluginMethodTable table;
        table[PluginMethod::Update] = [this](ExecutionContext& context) {
            updateCalls++;
            observedBudget = context.performance.maxExecutionTime;
            if (updateCost.count() > 0) {
                std::this_thread::sleep_for(updateCost);
            }
            if (throwOnUpdate) {
                throw std::runtime_error("boom");
            }
        };
        return table;
    }

    std::string version = "1.0.0";
    std::chrono::milliseconds initDelay{0};
    std::chrono::milliseconds updateCost{0};
    bool failInit = false;
    bool failDestroy = false;
    bool throwOnUpdate = false;

    int initCount = 0;
    int destroyCount = 0;
    int updateCalls = 0;
    double observedBudget = -1.0;

  private:
    std::string name_;
    std::vector<std::string> dependencies_;
    std::vector<std::string>* journal_;
};

class PluginTest : public ::testing::Test {
  protected:
    std::shared_ptr<TestPlugin> add(const std::string& name, std::vector<std::string> deps = {}) {
        auto plugin = std::make_shared<TestPlugin>(name, std::move(deps), &journal);
        EXPECT_TRUE(manager.registerPlugin(plugin));
        return plugin;
    }

    PluginStatus statusOf(const std::string& name) const { return manager.getPluginMetadata(name)->status; }

    asio::io_context io;
    std::vector<std::string> journal;
    PluginManager manager;
};

// --- Registration ---

TEST_F(PluginTest, RegisterPlugin) {
    auto plugin = std::make_shared<TestPlugin>("physics");
    EXPECT_TRUE(manager.registerPlugin(plugin));

    EXPECT_EQ(manager.getPlugin("physics"), plugin);
    EXPECT_EQ(statusOf("physics"), PluginStatus::Registered);
    EXPECT_FALSE(manager.hasPlugin("physics"));
    EXPECT_EQ(manager.getPluginNames(), std::vector<std::string>{"physics"});
}

TEST_F(PluginTest, RegisterRejectsInvalidShape) {
    EXPECT_FALSE(manager.registerPlugin(nullptr));
    EXPECT_FALSE(manager.registerPlugin(std::make_shared<TestPlugin>("")));

    auto unversioned = std::make_shared<TestPlugin>("unversioned");
    unversioned->version = "";
    EXPECT_FALSE(manager.registerPlugin(unversioned));

    EXPECT_FALSE(manager.registerPlugin(std::make_shared<TestPlugin>("self", std::vector<std::string>{"self"})));
    EXPECT_FALSE(manager.registerPlugin(std::make_shared<TestPlugin>("blank", std::vector<std::string>{""})));

    EXPECT_TRUE(manager.getPluginNames().empty());
}

TEST_F(PluginTest, RegisterRejectsDuplicateName) {
    auto first = add("audio");
    EXPECT_FALSE(manager.registerPlugin(std::make_shared<TestPlugin>("audio")));

    EXPECT_EQ(manager.getPlugin("audio"), first);
    EXPECT_EQ(manager.getPluginNames().size(), 1u);
}

TEST_F(PluginTest, RegisterRejectsMissingDependency) {
    auto orphan = std::make_shared<TestPlugin>("orphan", std::vector<std::string>{"ghost"});
    EXPECT_FALSE(manager.registerPlugin(orphan));
    EXPECT_EQ(manager.getPlugin("orphan"), nullptr);
    EXPECT_FALSE(manager.getPluginMetadata("orphan").has_value());

    // Registering the dependency later does not admit the rejected plugin.
    add("ghost");
    EXPECT_EQ(manager.getPlugin("orphan"), nullptr);
    EXPECT_TRUE(manager.registerPlugin(orphan));
}

// --- Dependency order ---

TEST_F(PluginTest, InitializeAllFollowsDependencyOrder) {
    add("base");
    add("mid", {"base"});
    add("top", {"mid"});

    auto report = runAwaitable(io, manager.initializeAll());
    ASSERT_TRUE(report.isOk());
    EXPECT_EQ(report.value().attempted(), 3u);
    EXPECT_TRUE(report.value().allSucceeded());

    EXPECT_EQ(journal, (std::vector<std::string>{"init:base", "init:mid", "init:top"}));
    EXPECT_TRUE(manager.hasPlugin("base"));
    EXPECT_TRUE(manager.hasPlugin("mid"));
    EXPECT_TRUE(manager.hasPlugin("top"));
}

TEST_F(PluginTest, ResolveDependencyOrderForDiamond) {
    add("core");
    add("left", {"core"});
    add("right", {"core"});
    add("top", {"right", "left"});

    auto order = manager.resolveDependencyOrder();
    ASSERT_TRUE(order.isOk());
    EXPECT_EQ(order.value(), (std::vector<std::string>{"core", "left", "right", "top"}));
}

TEST_F(PluginTest, DestroyAllRunsInReverseDependencyOrder) {
    add("base");
    add("mid", {"base"});
    add("top", {"mid"});
    ASSERT_TRUE(runAwaitable(io, manager.initializeAll()).isOk());
    journal.clear();

    auto report = runAwaitable(io, manager.destroyAll());
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"top", "mid", "base"}));
    EXPECT_TRUE(report.failed.empty());

    EXPECT_EQ(journal, (std::vector<std::string>{"destroy:top", "destroy:mid", "destroy:base"}));
    EXPECT_EQ(statusOf("base"), PluginStatus::Destroyed);
}

TEST_F(PluginTest, DestroyAllSkipsPluginsThatAreNotActive) {
    add("idle");
    auto active = add("active");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("active")));

    auto report = runAwaitable(io, manager.destroyAll());
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"active"});
    EXPECT_EQ(active->destroyCount, 1);
    EXPECT_EQ(statusOf("idle"), PluginStatus::Registered);
}

TEST_F(PluginTest, CycleFromReregistrationFailsInitializeAll) {
    add("alpha");
    add("beta", {"alpha"});

    EXPECT_TRUE(manager.unregisterPlugin("alpha"));
    EXPECT_TRUE(manager.registerPlugin(std::make_shared<TestPlugin>("alpha", std::vector<std::string>{"beta"},
                                                                    &journal)));

    auto order = manager.resolveDependencyOrder();
    ASSERT_TRUE(order.isError());
    EXPECT_EQ(order.code(), ErrorCode::DependencyCycle);

    auto report = runAwaitable(io, manager.initializeAll());
    ASSERT_TRUE(report.isError());
    EXPECT_EQ(report.code(), ErrorCode::DependencyCycle);
    EXPECT_TRUE(journal.empty());
    EXPECT_EQ(statusOf("alpha"), PluginStatus::Registered);
    EXPECT_EQ(statusOf("beta"), PluginStatus::Registered);
}

TEST_F(PluginTest, UnregisteredDependencyIsSkippedDuringResolution) {
    add("lib");
    add("app", {"lib"});
    EXPECT_TRUE(manager.unregisterPlugin("lib"));

    auto order = manager.resolveDependencyOrder();
    ASSERT_TRUE(order.isOk());
    EXPECT_EQ(order.value(), std::vector<std::string>{"app"});
}

// --- Initialization ---

TEST_F(PluginTest, InitializeUnknownPluginFails) {
    EXPECT_FALSE(runAwaitable(io, manager.initializePlugin("missing")));
}

TEST_F(PluginTest, InitializeRecordsInitTime) {
    auto plugin = add("timed");
    plugin->initDelay = std::chrono::milliseconds(20);

    EXPECT_TRUE(runAwaitable(io, manager.initializePlugin("timed")));

    auto metadata = manager.getPluginMetadata("timed");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->status, PluginStatus::Active);
    EXPECT_GE(metadata->metrics.initTime, 15.0);
}

TEST_F(PluginTest, InitializeActivePluginDoesNotRerunInit) {
    auto plugin = add("once");
    EXPECT_TRUE(runAwaitable(io, manager.initializePlugin("once")));
    EXPECT_TRUE(runAwaitable(io, manager.initializePlugin("once")));
    EXPECT_EQ(plugin->initCount, 1);
}

TEST_F(PluginTest, InitializeTimesOut) {
    PluginManagerConfig config;
    config.executionTimeout = 100.0;
    PluginManager timed(config);

    auto slow = std::make_shared<TestPlugin>("slow");
    slow->initDelay = std::chrono::milliseconds(200);
    ASSERT_TRUE(timed.registerPlugin(slow));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(runAwaitable(io, timed.initializePlugin("slow")));
    const double elapsed = async::elapsedMs(start);

    EXPECT_GE(elapsed, 90.0);
    EXPECT_LT(elapsed, 190.0);

    auto metadata = timed.getPluginMetadata("slow");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->status, PluginStatus::Error);
    EXPECT_EQ(metadata->metrics.errorCount, 1u);
    ASSERT_TRUE(metadata->metrics.lastError.has_value());
    EXPECT_NE(metadata->metrics.lastError->find("timed out"), std::string::npos);
    EXPECT_EQ(metadata->metrics.lastErrorCode, ErrorCode::Timeout);

    // The abandoned init still finishes, but the recorded status stands.
    drain(io);
    EXPECT_EQ(slow->initCount, 1);
    EXPECT_EQ(timed.getPluginMetadata("slow")->status, PluginStatus::Error);
}

TEST_F(PluginTest, InitializeAllContinuesPastFailures) {
    auto broken = add("broken");
    broken->failInit = true;
    add("healthy");

    auto report = runAwaitable(io, manager.initializeAll());
    ASSERT_TRUE(report.isOk());
    EXPECT_EQ(report.value().failed, std::vector<std::string>{"broken"});
    EXPECT_EQ(report.value().succeeded, std::vector<std::string>{"healthy"});

    auto metadata = manager.getPluginMetadata("broken");
    EXPECT_EQ(metadata->status, PluginStatus::Error);
    EXPECT_EQ(metadata->metrics.errorCount, 1u);
    EXPECT_EQ(metadata->metrics.lastError, "init failed");
    EXPECT_EQ(metadata->metrics.lastErrorCode, ErrorCode::ExecutionFailed);
}

TEST_F(PluginTest, FailedPluginCanBeInitializedAgain) {
    auto flaky = add("flaky");
    flaky->failInit = true;
    EXPECT_FALSE(runAwaitable(io, manager.initializePlugin("flaky")));

    flaky->failInit = false;
    EXPECT_TRUE(runAwaitable(io, manager.initializePlugin("flaky")));
    EXPECT_EQ(statusOf("flaky"), PluginStatus::Active);
}

// --- Execution ---

TEST_F(PluginTest, ExecuteRequiresActivePlugin) {
    auto plugin = add("dormant");

    auto result = manager.executePlugin("dormant", PluginMethod::Update);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Plugin dormant not active");
    EXPECT_EQ(result.errorCode, ErrorCode::InvalidState);
    EXPECT_EQ(result.executionTime, 0.0);
    EXPECT_EQ(plugin->updateCalls, 0);

    auto missing = manager.executePlugin("nobody", PluginMethod::Update);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.errorCode, ErrorCode::NotFound);
}

TEST_F(PluginTest, ExecuteUnsupportedMethodFails) {
    add("updater");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("updater")));

    auto result = manager.executePlugin("updater", PluginMethod::Reset);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("reset"), std::string::npos);
    EXPECT_EQ(result.errorCode, ErrorCode::NotFound);
    EXPECT_EQ(manager.getPluginMetadata("updater")->metrics.errorCount, 0u);
    EXPECT_FALSE(manager.getPluginMetadata("updater")->metrics.lastErrorCode.has_value());
}

TEST_F(PluginTest, ExecuteRecordsMetricsAndStampsBudget) {
    auto plugin = add("ticker");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("ticker")));

    ExecutionContext context;
    context.deltaTime = 16.0;
    auto first = manager.executePlugin("ticker", PluginMethod::Update, &context);
    auto second = manager.executePlugin("ticker", PluginMethod::Update);

    EXPECT_TRUE(first.success);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(plugin->updateCalls, 2);
    EXPECT_EQ(context.performance.maxExecutionTime, manager.config().maxExecutionTimePerFrame);
    EXPECT_EQ(plugin->observedBudget, manager.config().maxExecutionTimePerFrame);

    auto metrics = manager.getPluginMetadata("ticker")->metrics;
    EXPECT_EQ(metrics.executionCount, 2u);
    EXPECT_DOUBLE_EQ(metrics.lastExecutionTime, second.executionTime);
    EXPECT_DOUBLE_EQ(metrics.totalExecutionTime, first.executionTime + second.executionTime);
}

TEST_F(PluginTest, ExecuteFlagsBudgetOverrun) {
    PluginManagerConfig config;
    config.maxExecutionTimePerFrame = 1.0;
    PluginManager budgeted(config);

    auto heavy = std::make_shared<TestPlugin>("heavy");
    heavy->updateCost = std::chrono::milliseconds(5);
    ASSERT_TRUE(budgeted.registerPlugin(heavy));
    ASSERT_TRUE(runAwaitable(io, budgeted.initializePlugin("heavy")));

    auto result = budgeted.executePlugin("heavy", PluginMethod::Update);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.exceededBudget);
    EXPECT_GE(result.executionTime, 5.0);

    auto stats = budgeted.getPerformanceStats();
    EXPECT_EQ(stats.pluginsExceedingBudget, std::vector<std::string>{"heavy"});
}

TEST_F(PluginTest, ExecuteWithinBudgetIsNotFlagged) {
    PluginManagerConfig config;
    config.maxExecutionTimePerFrame = 1000.0;
    PluginManager generous(config);

    ASSERT_TRUE(generous.registerPlugin(std::make_shared<TestPlugin>("light")));
    ASSERT_TRUE(runAwaitable(io, generous.initializePlugin("light")));

    auto result = generous.executePlugin("light", PluginMethod::Update);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.exceededBudget);
    EXPECT_LT(result.executionTime, 1000.0);
    EXPECT_TRUE(generous.getPerformanceStats().pluginsExceedingBudget.empty());
}

TEST_F(PluginTest, ExecuteIsolatesThrowingPlugin) {
    auto plugin = add("fragile");
    plugin->throwOnUpdate = true;
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("fragile")));

    auto result = manager.executePlugin("fragile", PluginMethod::Update);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "boom");
    EXPECT_EQ(result.errorCode, ErrorCode::ExecutionFailed);

    auto metadata = manager.getPluginMetadata("fragile");
    EXPECT_EQ(metadata->status, PluginStatus::Active);
    EXPECT_EQ(metadata->metrics.errorCount, 1u);
    EXPECT_EQ(metadata->metrics.lastError, "boom");
    EXPECT_EQ(metadata->metrics.lastErrorCode, ErrorCode::ExecutionFailed);
    EXPECT_EQ(metadata->metrics.executionCount, 0u);
}

TEST_F(PluginTest, PerformanceStatsAverageOverActivePlugins) {
    add("a");
    add("b");
    add("idle");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("a")));
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("b")));

    auto ra = manager.executePlugin("a", PluginMethod::Update);
    auto rb = manager.executePlugin("b", PluginMethod::Update);

    auto stats = manager.getPerformanceStats();
    EXPECT_EQ(stats.totalPlugins, 3u);
    EXPECT_EQ(stats.activePlugins, 2u);
    EXPECT_DOUBLE_EQ(stats.totalExecutionTime, ra.executionTime + rb.executionTime);
    EXPECT_DOUBLE_EQ(stats.averageExecutionTime, stats.totalExecutionTime / 2.0);
}

TEST_F(PluginTest, PerformanceStatsWithoutActivePlugins) {
    add("idle");
    auto stats = manager.getPerformanceStats();
    EXPECT_EQ(stats.totalPlugins, 1u);
    EXPECT_EQ(stats.activePlugins, 0u);
    EXPECT_EQ(stats.averageExecutionTime, 0.0);
    EXPECT_TRUE(stats.pluginsExceedingBudget.empty());
}

// --- Teardown ---

TEST_F(PluginTest, DestroyRequiresActiveOrError) {
    add("fresh");
    EXPECT_FALSE(runAwaitable(io, manager.destroyPlugin("fresh")));
    EXPECT_FALSE(runAwaitable(io, manager.destroyPlugin("missing")));
    EXPECT_EQ(statusOf("fresh"), PluginStatus::Registered);
}

TEST_F(PluginTest, DestroyedPluginCanBeReinitialized) {
    auto plugin = add("cycle");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("cycle")));
    ASSERT_TRUE(runAwaitable(io, manager.destroyPlugin("cycle")));

    EXPECT_EQ(statusOf("cycle"), PluginStatus::Destroyed);
    EXPECT_FALSE(manager.hasPlugin("cycle"));
    EXPECT_FALSE(manager.executePlugin("cycle", PluginMethod::Update).success);

    EXPECT_TRUE(runAwaitable(io, manager.initializePlugin("cycle")));
    EXPECT_EQ(plugin->initCount, 2);
    EXPECT_TRUE(manager.hasPlugin("cycle"));
}

TEST_F(PluginTest, DestroyFailureMarksErrorWithoutBlockingOthers) {
    add("first");
    auto stubborn = add("second");
    stubborn->failDestroy = true;
    ASSERT_TRUE(runAwaitable(io, manager.initializeAll()).isOk());

    auto report = runAwaitable(io, manager.destroyAll());
    EXPECT_EQ(report.failed, std::vector<std::string>{"second"});
    EXPECT_EQ(report.succeeded, std::vector<std::string>{"first"});

    auto metadata = manager.getPluginMetadata("second");
    EXPECT_EQ(metadata->status, PluginStatus::Error);
    EXPECT_EQ(metadata->metrics.lastError, "destroy failed");

    // Error plugins may still be destroyed directly.
    stubborn->failDestroy = false;
    EXPECT_TRUE(runAwaitable(io, manager.destroyPlugin("second")));
    EXPECT_EQ(statusOf("second"), PluginStatus::Destroyed);
}

TEST_F(PluginTest, UnregisterRejectsActivePlugin) {
    add("live");
    ASSERT_TRUE(runAwaitable(io, manager.initializePlugin("live")));

    EXPECT_FALSE(manager.unregisterPlugin("live"));
    EXPECT_FALSE(manager.unregisterPlugin("unknown"));

    ASSERT_TRUE(runAwaitable(io, manager.destroyPlugin("live")));
    EXPECT_TRUE(manager.unregisterPlugin("live"));
    EXPECT_EQ(manager.getPlugin("live"), nullptr);
    EXPECT_TRUE(manager.getPluginNames().empty());
}

TEST_F(PluginTest, MetadataSnapshot) {
    add("renderer");
    add("ui", {"renderer"});

    EXPECT_FALSE(manager.getPluginMetadata("nope").has_value());

    auto metadata = manager.getPluginMetadata("ui");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->name, "ui");
    EXPECT_EQ(metadata->version, "1.0.0");
    EXPECT_EQ(metadata->description, "Plugin used by the manager tests");
    EXPECT_EQ(metadata->dependencies, std::vector<std::string>{"renderer"});
    EXPECT_EQ(metadata->status, PluginStatus::Registered);
    EXPECT_EQ(metadata->metrics.executionCount, 0u);
    EXPECT_FALSE(metadata->metrics.lastError.has_value());
}

TEST_F(PluginTest, StatusNames) {
    EXPECT_EQ(pluginStatusToString(PluginStatus::Registered), "registered");
    EXPECT_EQ(pluginStatusToString(PluginStatus::Destroyed), "destroyed");
    EXPECT_EQ(pluginMethodToString(PluginMethod::ApplyEffect), "applyEffect");
}
