#include "brickforge/core/EffectPlugin.hh"
#include "brickforge/core/Async.hh"
#include "brickforge/core/Log.hh"
#include "brickforge/utils/ErrorHandling.hh"
#include "brickforge/utils/Profiler.hh"

#include <algorithm>

namespace brickforge {

namespace {

EffectContext& requireEffectContext(ExecutionContext& context, PluginMethod method) {
    auto* effectContext = dynamic_cast<EffectContext*>(&context);
    if (!effectContext) {
        throwError(pluginMethodToString(method) + " requires an EffectContext");
    }
    return *effectContext;
}

void expectSuccess(const EffectResult& result) {
    if (!result.success) {
        throwError(result.error.value_or("effect reported failure"));
    }
}

} // namespace

EffectResult EffectResult::unchanged() {
    EffectResult result;
    result.success = true;
    return result;
}

EffectResult EffectResult::applied(EffectPatch rollback) {
    EffectResult result;
    result.success = true;
    result.modified = true;
    result.rollback = std::move(rollback);
    return result;
}

EffectResult EffectResult::failure(std::string error, ErrorCode code) {
    EffectResult result;
    result.error = std::move(error);
    result.errorCode = code;
    return result;
}

std::string effectEventToString(EffectEvent event) {
    switch (event) {
        case EffectEvent::Activate:
            return "activate";
        case EffectEvent::Update:
            return "update";
        case EffectEvent::Deactivate:
            return "deactivate";
        case EffectEvent::Conflict:
            return "conflict";
        case EffectEvent::Stack:
            return "stack";
    }
    return "unknown";
}

EffectPlugin::EffectPlugin(std::string name, std::string version, PowerUpType type, PowerUpEffect effect,
                           std::string description, std::vector<std::string> dependencies)
    : name_(std::move(name)),
      version_(std::move(version)),
      description_(std::move(description)),
      dependencies_(std::move(dependencies)),
      type_(type),
      effect_(std::move(effect)) {
    if (description_.empty()) {
        description_ = powerUpTypeToString(type_) + " power-up plugin";
    }
}

asio::awaitable<void> EffectPlugin::init() {
    try {
        co_await onInit();
    } catch (const std::exception& e) {
        BRICKFORGE_PLUGIN_ERROR("Failed to initialize power-up plugin {}: {}", name_, e.what());
        throw;
    }
    initialized_ = true;
    BRICKFORGE_PLUGIN_INFO("Power-up plugin {} initialized", name_);
}

asio::awaitable<void> EffectPlugin::destroy() {
    try {
        co_await onDestroy();
    } catch (const std::exception& e) {
        BRICKFORGE_PLUGIN_ERROR("Failed to destroy power-up plugin {}: {}", name_, e.what());
        throw;
    }
    initialized_ = false;
    BRICKFORGE_PLUGIN_INFO("Power-up plugin {} destroyed", name_);
}

asio::awaitable<void> EffectPlugin::onInit() {
    co_return;
}

asio::awaitable<void> EffectPlugin::onDestroy() {
    co_return;
}

PluginMethodTable EffectPlugin::methods() {
    PluginMethodTable table;
    table[PluginMethod::ApplyEffect] = [this](ExecutionContext& context) {
        expectSuccess(applyEffect(requireEffectContext(context, PluginMethod::ApplyEffect)));
    };
    table[PluginMethod::RemoveEffect] = [this](ExecutionContext& context) {
        expectSuccess(removeEffect(requireEffectContext(context, PluginMethod::RemoveEffect)));
    };
    table[PluginMethod::UpdateEffect] = [this](ExecutionContext& context) {
        expectSuccess(updateEffect(requireEffectContext(context, PluginMethod::UpdateEffect)));
    };
    return table;
}

EffectResult EffectPlugin::applyEffect(EffectContext& context) {
    BRICKFORGE_ZONE_SCOPED_N("EffectPlugin::applyEffect");

    if (!initialized_) {
        return EffectResult::failure("Plugin " + name_ + " not initialized", ErrorCode::NotInitialized);
    }

    bool stacking = false;
    auto result = runHook("applyEffect", [&]() -> EffectResult {
        auto validation = validateEffect(context);
        if (!validation.success) {
            return validation;
        }
        stacking = effect_.stackable && sameTypeActive(context);
        return onApplyEffect(context);
    });

    if (result.success) {
        activations_++;
        notify(stacking ? EffectEvent::Stack : EffectEvent::Activate, context);
    }
    return result;
}

EffectResult EffectPlugin::removeEffect(EffectContext& context) {
    if (!initialized_) {
        return EffectResult::failure("Plugin " + name_ + " not initialized", ErrorCode::NotInitialized);
    }

    auto result = runHook("removeEffect", [&] { return onRemoveEffect(context); });
    if (result.success) {
        notify(EffectEvent::Deactivate, context);
    }
    return result;
}

EffectResult EffectPlugin::updateEffect(EffectContext& context) {
    if (!initialized_) {
        return EffectResult::failure("Plugin " + name_ + " not initialized", ErrorCode::NotInitialized);
    }

    auto result = runHook("updateEffect", [&] { return onUpdateEffect(context); });
    if (result.success) {
        notify(EffectEvent::Update, context);
    }
    return result;
}

EffectResult EffectPlugin::handleConflict(PowerUpType conflictingType, EffectContext& context) {
    if (!initialized_) {
        return EffectResult::failure("Plugin " + name_ + " not initialized", ErrorCode::NotInitialized);
    }

    auto result = runHook("handleConflict", [&] { return onHandleConflict(conflictingType, context); });
    if (result.success) {
        notify(EffectEvent::Conflict, context, conflictingType);
    }
    return result;
}

PowerUpMetadata EffectPlugin::getMetadata() const {
    PowerUpMetadata metadata;
    metadata.type = type_;
    metadata.name = name_;
    metadata.description = description_;
    metadata.icon = getIcon();
    metadata.color = getColor();
    metadata.rarity = getRarity();
    metadata.duration = getDuration();
    metadata.effect = effect_;
    return metadata;
}

EffectPerformanceMetrics EffectPlugin::getPerformanceMetrics() const {
    EffectPerformanceMetrics metrics;
    metrics.totalExecutionTime = totalExecutionTime_;
    metrics.averageExecutionTime = activations_ > 0 ? totalExecutionTime_ / static_cast<double>(activations_) : 0.0;
    metrics.activations = activations_;
    metrics.isInitialized = initialized_;
    return metrics;
}

EffectResult EffectPlugin::validateEffect(const EffectContext& context) const {
    const auto& budget = context.performance;
    if (budget.maxExecutionTime > 0.0) {
        const double elapsed = budget.elapsedMs();
        if (elapsed > budget.maxExecutionTime) {
            return EffectResult::failure("Time budget exceeded: " + std::to_string(elapsed) + "ms",
                                         ErrorCode::Timeout);
        }
    }

    if (context.gameState && !effect_.conflictsWith.empty()) {
        for (const auto& active : context.gameState->activePowerUps()) {
            if (effect_.conflictsWithType(active.type) && active.priority >= effect_.priority) {
                return EffectResult::failure("Conflicts with active " + powerUpTypeToString(active.type) +
                                             " power-up '" + active.id + "' (priority " +
                                             std::to_string(active.priority) + " >= " +
                                             std::to_string(effect_.priority) + ")",
                                             ErrorCode::InvalidState);
            }
        }
    }

    return EffectResult::unchanged();
}

GameSnapshot EffectPlugin::snapshot(const EffectContext& context) const {
    if (!context.gameState) {
        throwError("Plugin " + name_ + " has no game state to snapshot");
    }
    return captureSnapshot(*context.gameState);
}

EffectPatch EffectPlugin::diffSince(const GameSnapshot& before, const EffectContext& context) const {
    return EffectPatch::between(name_, before, snapshot(context));
}

EffectResult EffectPlugin::runHook(std::string_view hook, const std::function<EffectResult()>& body) {
    const auto start = std::chrono::steady_clock::now();

    EffectResult result;
    try {
        result = body();
    } catch (const std::exception& e) {
        result = EffectResult::failure(e.what());
    } catch (...) {
        result = EffectResult::failure("unknown error");
    }

    totalExecutionTime_ += async::elapsedMs(start);

    if (!result.success) {
        if (!result.error) {
            result.error = std::string(hook) + " reported failure";
        }
        if (!result.errorCode) {
            result.errorCode = ErrorCode::ExecutionFailed;
        }
        BRICKFORGE_PLUGIN_WARN("Plugin {} {} failed: {}", name_, hook, *result.error);
    }
    return result;
}

void EffectPlugin::notify(EffectEvent event, const EffectContext& context,
                          std::optional<PowerUpType> conflictingType) const {
    BRICKFORGE_PLUGIN_DEBUG("Plugin {} effect {}", name_, effectEventToString(event));
    if (!listener_) {
        return;
    }

    EffectNotification notification;
    notification.event = event;
    notification.pluginName = name_;
    notification.powerUpType = type_;
    notification.powerUpId = context.powerUpId;
    notification.conflictingType = conflictingType;

    // The hook already changed the game state; the caller still needs the patch.
    try {
        listener_(notification);
    } catch (const std::exception& e) {
        BRICKFORGE_PLUGIN_WARN("Plugin {} {} listener failed: {}", name_, effectEventToString(event), e.what());
    } catch (...) {
        BRICKFORGE_PLUGIN_WARN("Plugin {} {} listener failed: unknown error", name_, effectEventToString(event));
    }
}

bool EffectPlugin::sameTypeActive(const EffectContext& context) const {
    if (!context.gameState) {
        return false;
    }
    const auto& active = context.gameState->activePowerUps();
    return std::any_of(active.begin(), active.end(), [this](const ActivePowerUp& p) { return p.type == type_; });
}

} // namespace brickforge
