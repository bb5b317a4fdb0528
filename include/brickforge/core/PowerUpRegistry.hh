#pragma once

#include "brickforge/core/EffectPlugin.hh"
#include "brickforge/core/Plugin.hh"
#include "brickforge/core/PowerUp.hh"
#include "brickforge/utils/ErrorHandling.hh"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace brickforge {

struct PowerUpRegistryStatus {
    std::size_t totalRegistered = 0;
    std::vector<std::string> ids;
    std::map<PowerUpType, std::vector<std::string>> idsByType;
};

// Indexes effect plugins by a host-chosen id (e.g. "paddle_large") on top
// of a PluginManager. Does not own the manager.
class PowerUpRegistry {
  public:
    explicit PowerUpRegistry(PluginManager& manager);

    /// Registers the plugin with the manager, then indexes it under `id`.
    /// InvalidArgument for an empty id or null plugin, AlreadyExists for a
    /// duplicate id, Internal when the manager rejects the plugin.
    Result<void> registerPowerUp(const std::string& id, std::shared_ptr<EffectPlugin> plugin);

    std::shared_ptr<EffectPlugin> getPowerUp(const std::string& id) const;

    // In registration order.
    std::vector<std::string> getRegisteredIds() const;

    // First registered plugin of `type`, nullptr if none.
    std::shared_ptr<EffectPlugin> findByType(PowerUpType type) const;
    std::vector<std::string> getIdsByType(PowerUpType type) const;

    /// Unregisters every indexed plugin from the manager, newest first.
    /// Plugins the manager refuses to drop (still Active) stay indexed and
    /// are reported as failed.
    BatchReport unregisterAll();

    PowerUpRegistryStatus getStatus() const;

  private:
    PluginManager& manager_;
    std::unordered_map<std::string, std::shared_ptr<EffectPlugin>> plugins_;
    std::vector<std::string> order_;
};

} // namespace brickforge
