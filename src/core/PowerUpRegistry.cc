#include "brickforge/core/PowerUpRegistry.hh"
#include "brickforge/core/Log.hh"

#include <algorithm>
#include <utility>

namespace brickforge {

PowerUpRegistry::PowerUpRegistry(PluginManager& manager) : manager_(manager) {}

Result<void> PowerUpRegistry::registerPowerUp(const std::string& id, std::shared_ptr<EffectPlugin> plugin) {
    if (id.empty()) {
        return Result<void>::error(ErrorCode::InvalidArgument, "Power-up id cannot be empty");
    }
    if (!plugin) {
        return Result<void>::error(ErrorCode::InvalidArgument, "Power-up '" + id + "' has no plugin");
    }
    if (plugins_.count(id) > 0) {
        return Result<void>::error(ErrorCode::AlreadyExists, "Power-up '" + id + "' is already registered");
    }

    const auto name = plugin->getName();
    if (!manager_.registerPlugin(plugin)) {
        BRICKFORGE_PLUGIN_ERROR("Failed to register power-up '{}' ({})", id, name);
        return Result<void>::error(ErrorCode::Internal,
                                   "Plugin manager rejected power-up '" + id + "' (" + name + ")");
    }

    plugins_.emplace(id, std::move(plugin));
    order_.push_back(id);
    BRICKFORGE_PLUGIN_INFO("Registered power-up '{}' ({})", id, name);
    return Result<void>::ok();
}

std::shared_ptr<EffectPlugin> PowerUpRegistry::getPowerUp(const std::string& id) const {
    auto it = plugins_.find(id);
    if (it == plugins_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> PowerUpRegistry::getRegisteredIds() const {
    return order_;
}

std::shared_ptr<EffectPlugin> PowerUpRegistry::findByType(PowerUpType type) const {
    for (const auto& id : order_) {
        const auto& plugin = plugins_.at(id);
        if (plugin->getPowerUpType() == type) {
            return plugin;
        }
    }
    return nullptr;
}

std::vector<std::string> PowerUpRegistry::getIdsByType(PowerUpType type) const {
    std::vector<std::string> ids;
    for (const auto& id : order_) {
        if (plugins_.at(id)->getPowerUpType() == type) {
            ids.push_back(id);
        }
    }
    return ids;
}

BatchReport PowerUpRegistry::unregisterAll() {
    BatchReport report;
    const std::vector<std::string> ids(order_.rbegin(), order_.rend());

    for (const auto& id : ids) {
        const auto name = plugins_.at(id)->getName();
        if (!manager_.unregisterPlugin(name)) {
            BRICKFORGE_PLUGIN_WARN("Could not unregister power-up '{}' ({})", id, name);
            report.failed.push_back(id);
            continue;
        }

        plugins_.erase(id);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        report.succeeded.push_back(id);
    }

    BRICKFORGE_PLUGIN_INFO("Unregistered {} power-ups, {} remain", report.succeeded.size(), order_.size());
    return report;
}

PowerUpRegistryStatus PowerUpRegistry::getStatus() const {
    PowerUpRegistryStatus status;
    status.totalRegistered = order_.size();
    status.ids = order_;
    for (const auto& id : order_) {
        status.idsByType[plugins_.at(id)->getPowerUpType()].push_back(id);
    }
    return status;
}

} // namespace brickforge
