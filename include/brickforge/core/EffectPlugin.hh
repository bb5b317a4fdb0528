#pragma once

#include "brickforge/core/GameState.hh"
#include "brickforge/core/Plugin.hh"
#include "brickforge/core/PowerUp.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace brickforge {

// Context for one effect hook call. Passed through executePlugin as an
// ExecutionContext and recovered with dynamic_cast.
struct EffectContext : ExecutionContext {
    PowerUpType powerUpType = PowerUpType::MultiBall;
    std::string powerUpId;
    nlohmann::json effectData;
};

struct EffectResult {
    bool success = false;
    bool modified = false;
    std::optional<EffectPatch> rollback;
    std::optional<std::string> error;
    std::optional<ErrorCode> errorCode;

    // Succeeded without touching the game state.
    static EffectResult unchanged();

    // Succeeded and modified the game state; `rollback` undoes it.
    static EffectResult applied(EffectPatch rollback);

    static EffectResult failure(std::string error, ErrorCode code = ErrorCode::ExecutionFailed);
};

enum class EffectEvent : uint8_t {
    Activate,
    Update,
    Deactivate,
    Conflict,
    Stack
};

std::string effectEventToString(EffectEvent event);

struct EffectNotification {
    EffectEvent event = EffectEvent::Activate;
    std::string pluginName;
    PowerUpType powerUpType = PowerUpType::MultiBall;
    std::string powerUpId;
    std::optional<PowerUpType> conflictingType;
};

// Bridge to the host's event bus. A throwing listener is logged and ignored.
using EffectEventListener = std::function<void(const EffectNotification&)>;

struct EffectPerformanceMetrics {
    double totalExecutionTime = 0.0; // ms, all hook calls
    double averageExecutionTime = 0.0; // ms per activation
    uint64_t activations = 0;
    bool isInitialized = false;
};

/// Base class of every power-up plugin.
///
/// Wraps the subclass hooks with an initialization guard, timing and
/// exception capture, so a failing hook comes back as a failed EffectResult.
/// Hooks run synchronously on the caller's thread.
class EffectPlugin : public Plugin {
  public:
    EffectPlugin(std::string name, std::string version, PowerUpType type, PowerUpEffect effect,
                 std::string description = {}, std::vector<std::string> dependencies = {});

    std::string getName() const override { return name_; }
    std::string getVersion() const override { return version_; }
    std::string getDescription() const override { return description_; }
    std::vector<std::string> getDependencies() const override { return dependencies_; }

    asio::awaitable<void> init() final;
    asio::awaitable<void> destroy() final;

    /// ApplyEffect, RemoveEffect and UpdateEffect. Each requires an
    /// EffectContext and throws when the hook reports failure.
    PluginMethodTable methods() override;

    EffectResult applyEffect(EffectContext& context);
    EffectResult removeEffect(EffectContext& context);
    EffectResult updateEffect(EffectContext& context);
    EffectResult handleConflict(PowerUpType conflictingType, EffectContext& context);

    PowerUpType getPowerUpType() const { return type_; }
    const PowerUpEffect& getEffect() const { return effect_; }
    bool isInitialized() const { return initialized_; }

    PowerUpMetadata getMetadata() const;
    EffectPerformanceMetrics getPerformanceMetrics() const;
    double getExecutionTime() const { return totalExecutionTime_; }

    void setEventListener(EffectEventListener listener) { listener_ = std::move(listener); }

  protected:
    virtual asio::awaitable<void> onInit();
    virtual asio::awaitable<void> onDestroy();

    virtual EffectResult onApplyEffect(EffectContext& context) = 0;
    virtual EffectResult onRemoveEffect(EffectContext& context) = 0;
    virtual EffectResult onUpdateEffect(EffectContext& context) = 0;
    virtual EffectResult onHandleConflict(PowerUpType conflictingType, EffectContext& context) = 0;

    virtual std::string getIcon() const = 0;
    virtual std::string getColor() const = 0;
    virtual Rarity getRarity() const = 0;
    virtual std::chrono::milliseconds getDuration() const = 0;

    /// Remaining time budget first, then conflicts with active power-ups:
    /// an active power-up of a type we conflict with and at least our
    /// priority blocks the application.
    virtual EffectResult validateEffect(const EffectContext& context) const;

    /// Copy of the context's game state. Throws if the context has none.
    GameSnapshot snapshot(const EffectContext& context) const;

    /// Patch from `before` to the context's current game state, tagged with
    /// this plugin's name.
    EffectPatch diffSince(const GameSnapshot& before, const EffectContext& context) const;

  private:
    EffectResult runHook(std::string_view hook, const std::function<EffectResult()>& body);
    void notify(EffectEvent event, const EffectContext& context,
                std::optional<PowerUpType> conflictingType = std::nullopt) const;
    bool sameTypeActive(const EffectContext& context) const;

    std::string name_;
    std::string version_;
    std::string description_;
    std::vector<std::string> dependencies_;
    PowerUpType type_;
    PowerUpEffect effect_;

    bool initialized_ = false;
    double totalExecutionTime_ = 0.0;
    uint64_t activations_ = 0;
    EffectEventListener listener_;
};

} // namespace brickforge
