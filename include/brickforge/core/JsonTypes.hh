#pragma once

#include <nlohmann/json.hpp>
#include "brickforge/core/GameState.hh"
#include "brickforge/core/PowerUp.hh"

// ADL-visible to_json/from_json for brickforge state and power-up types.
// Enables: nlohmann::json j = patch; auto p = j.get<EffectPatch>();
// Enum values are written as their lowercase names; unknown names throw
// BrickforgeException on read.

namespace brickforge {

void to_json(nlohmann::json& j, PowerUpType type);
void from_json(const nlohmann::json& j, PowerUpType& type);

void to_json(nlohmann::json& j, Rarity rarity);
void from_json(const nlohmann::json& j, Rarity& rarity);

void to_json(nlohmann::json& j, const Vec2& v);
void from_json(const nlohmann::json& j, Vec2& v);

void to_json(nlohmann::json& j, const Ball& ball);
void from_json(const nlohmann::json& j, Ball& ball);

void to_json(nlohmann::json& j, const Paddle& paddle);
void from_json(const nlohmann::json& j, Paddle& paddle);

void to_json(nlohmann::json& j, const Block& block);
void from_json(const nlohmann::json& j, Block& block);

void to_json(nlohmann::json& j, const ActivePowerUp& powerUp);
void from_json(const nlohmann::json& j, ActivePowerUp& powerUp);

void to_json(nlohmann::json& j, const GameSnapshot& snapshot);
void from_json(const nlohmann::json& j, GameSnapshot& snapshot);

// --- StateChange ---

template <typename T>
void to_json(nlohmann::json& j, const StateChange<T>& change) {
  j = nlohmann::json{{"before", change.before}, {"after", change.after}};
}

template <typename T>
void from_json(const nlohmann::json& j, StateChange<T>& change) {
  j.at("before").get_to(change.before);
  j.at("after").get_to(change.after);
}

void to_json(nlohmann::json& j, const EffectPatch& patch);
void from_json(const nlohmann::json& j, EffectPatch& patch);

void to_json(nlohmann::json& j, const PowerUpEffect& effect);
void from_json(const nlohmann::json& j, PowerUpEffect& effect);

void to_json(nlohmann::json& j, const PowerUpMetadata& metadata);
void from_json(const nlohmann::json& j, PowerUpMetadata& metadata);

} // namespace brickforge
