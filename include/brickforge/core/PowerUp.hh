#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brickforge {

enum class PowerUpType : uint8_t {
    MultiBall,
    PaddleSize,
    BallSpeed,
    Penetration,
    Magnet
};

enum class Rarity : uint8_t {
    Common,
    Rare,
    Epic
};

std::string powerUpTypeToString(PowerUpType type);
std::optional<PowerUpType> powerUpTypeFromString(std::string_view name);

std::string rarityToString(Rarity rarity);
std::optional<Rarity> rarityFromString(std::string_view name);

// Conflict and stacking rules of one effect. Higher priority wins conflicts.
struct PowerUpEffect {
    std::string id;
    int32_t priority = 0;
    bool stackable = false;
    std::vector<PowerUpType> conflictsWith;

    bool conflictsWithType(PowerUpType type) const;

    bool operator==(const PowerUpEffect&) const = default;
};

// Presentation descriptor: static plugin data plus its live effect rules.
struct PowerUpMetadata {
    PowerUpType type = PowerUpType::MultiBall;
    std::string name;
    std::string description;
    std::string icon;
    std::string color;
    Rarity rarity = Rarity::Common;
    std::chrono::milliseconds duration{0};
    PowerUpEffect effect;

    bool operator==(const PowerUpMetadata&) const = default;
};

} // namespace brickforge
