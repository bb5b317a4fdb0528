#include "brickforge/core/PowerUp.hh"

#include <algorithm>

namespace brickforge {

std::string powerUpTypeToString(PowerUpType type) {
    switch (type) {
        case PowerUpType::MultiBall:
            return "multiball";
        case PowerUpType::PaddleSize:
            return "paddlesize";
        case PowerUpType::BallSpeed:
            return "ballspeed";
        case PowerUpType::Penetration:
            return "penetration";
        case PowerUpType::Magnet:
            return "magnet";
        default:
            return "unknown";
    }
}

std::optional<PowerUpType> powerUpTypeFromString(std::string_view name) {
    for (auto type : {PowerUpType::MultiBall, PowerUpType::PaddleSize, PowerUpType::BallSpeed,
                      PowerUpType::Penetration, PowerUpType::Magnet}) {
        if (powerUpTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string rarityToString(Rarity rarity) {
    switch (rarity) {
        case Rarity::Common:
            return "common";
        case Rarity::Rare:
            return "rare";
        case Rarity::Epic:
            return "epic";
        default:
            return "unknown";
    }
}

std::optional<Rarity> rarityFromString(std::string_view name) {
    for (auto rarity : {Rarity::Common, Rarity::Rare, Rarity::Epic}) {
        if (rarityToString(rarity) == name) {
            return rarity;
        }
    }
    return std::nullopt;
}

bool PowerUpEffect::conflictsWithType(PowerUpType type) const {
    return std::find(conflictsWith.begin(), conflictsWith.end(), type) != conflictsWith.end();
}

} // namespace brickforge
