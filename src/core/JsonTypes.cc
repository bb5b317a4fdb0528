#include "brickforge/core/JsonTypes.hh"
#include "brickforge/utils/ErrorHandling.hh"

#include <string>

namespace brickforge {

// --- Enums ---

void to_json(nlohmann::json& j, PowerUpType type) {
  j = powerUpTypeToString(type);
}

void from_json(const nlohmann::json& j, PowerUpType& type) {
  auto name = j.get<std::string>();
  auto parsed = powerUpTypeFromString(name);
  if (!parsed) {
    throwError("Unknown power-up type '" + name + "'");
  }
  type = *parsed;
}

void to_json(nlohmann::json& j, Rarity rarity) {
  j = rarityToString(rarity);
}

void from_json(const nlohmann::json& j, Rarity& rarity) {
  auto name = j.get<std::string>();
  auto parsed = rarityFromString(name);
  if (!parsed) {
    throwError("Unknown rarity '" + name + "'");
  }
  rarity = *parsed;
}

// --- Entities ---

void to_json(nlohmann::json& j, const Vec2& v) {
  j = nlohmann::json{{"x", v.x}, {"y", v.y}};
}

void from_json(const nlohmann::json& j, Vec2& v) {
  j.at("x").get_to(v.x);
  j.at("y").get_to(v.y);
}

void to_json(nlohmann::json& j, const Ball& ball) {
  j = nlohmann::json{{"id", ball.id},
                     {"position", ball.position},
                     {"velocity", ball.velocity},
                     {"radius", ball.radius},
                     {"active", ball.active}};
}

void from_json(const nlohmann::json& j, Ball& ball) {
  j.at("id").get_to(ball.id);
  j.at("position").get_to(ball.position);
  j.at("velocity").get_to(ball.velocity);
  j.at("radius").get_to(ball.radius);
  j.at("active").get_to(ball.active);
}

void to_json(nlohmann::json& j, const Paddle& paddle) {
  j = nlohmann::json{{"position", paddle.position},
                     {"width", paddle.width},
                     {"height", paddle.height},
                     {"speed", paddle.speed},
                     {"active", paddle.active}};
}

void from_json(const nlohmann::json& j, Paddle& paddle) {
  j.at("position").get_to(paddle.position);
  j.at("width").get_to(paddle.width);
  j.at("height").get_to(paddle.height);
  j.at("speed").get_to(paddle.speed);
  j.at("active").get_to(paddle.active);
}

void to_json(nlohmann::json& j, const Block& block) {
  j = nlohmann::json{{"id", block.id},
                     {"position", block.position},
                     {"width", block.width},
                     {"height", block.height},
                     {"hitPoints", block.hitPoints},
                     {"destroyed", block.destroyed}};
}

void from_json(const nlohmann::json& j, Block& block) {
  j.at("id").get_to(block.id);
  j.at("position").get_to(block.position);
  j.at("width").get_to(block.width);
  j.at("height").get_to(block.height);
  j.at("hitPoints").get_to(block.hitPoints);
  j.at("destroyed").get_to(block.destroyed);
}

void to_json(nlohmann::json& j, const ActivePowerUp& powerUp) {
  j = nlohmann::json{{"id", powerUp.id},
                     {"type", powerUp.type},
                     {"pluginName", powerUp.pluginName},
                     {"priority", powerUp.priority},
                     {"remainingMs", powerUp.remainingMs}};
}

void from_json(const nlohmann::json& j, ActivePowerUp& powerUp) {
  j.at("id").get_to(powerUp.id);
  j.at("type").get_to(powerUp.type);
  j.at("pluginName").get_to(powerUp.pluginName);
  j.at("priority").get_to(powerUp.priority);
  j.at("remainingMs").get_to(powerUp.remainingMs);
}

void to_json(nlohmann::json& j, const GameSnapshot& snapshot) {
  j = nlohmann::json{{"balls", snapshot.balls}, {"paddle", snapshot.paddle}, {"blocks", snapshot.blocks}};
}

void from_json(const nlohmann::json& j, GameSnapshot& snapshot) {
  j.at("balls").get_to(snapshot.balls);
  j.at("paddle").get_to(snapshot.paddle);
  j.at("blocks").get_to(snapshot.blocks);
}

// --- EffectPatch ---
// Absent groups are omitted rather than written as null.

void to_json(nlohmann::json& j, const EffectPatch& patch) {
  j = nlohmann::json{{"source", patch.source}};
  if (patch.balls) {
    j["balls"] = *patch.balls;
  }
  if (patch.paddle) {
    j["paddle"] = *patch.paddle;
  }
  if (patch.blocks) {
    j["blocks"] = *patch.blocks;
  }
}

void from_json(const nlohmann::json& j, EffectPatch& patch) {
  j.at("source").get_to(patch.source);

  patch.balls.reset();
  patch.paddle.reset();
  patch.blocks.reset();

  if (j.contains("balls")) {
    patch.balls = j.at("balls").get<StateChange<std::vector<Ball>>>();
  }
  if (j.contains("paddle")) {
    patch.paddle = j.at("paddle").get<StateChange<Paddle>>();
  }
  if (j.contains("blocks")) {
    patch.blocks = j.at("blocks").get<StateChange<std::vector<Block>>>();
  }
}

// --- Power-up descriptors ---

void to_json(nlohmann::json& j, const PowerUpEffect& effect) {
  j = nlohmann::json{{"id", effect.id},
                     {"priority", effect.priority},
                     {"stackable", effect.stackable},
                     {"conflictsWith", effect.conflictsWith}};
}

void from_json(const nlohmann::json& j, PowerUpEffect& effect) {
  j.at("id").get_to(effect.id);
  j.at("priority").get_to(effect.priority);
  j.at("stackable").get_to(effect.stackable);
  effect.conflictsWith = j.value("conflictsWith", std::vector<PowerUpType>{});
}

void to_json(nlohmann::json& j, const PowerUpMetadata& metadata) {
  j = nlohmann::json{{"type", metadata.type},
                     {"name", metadata.name},
                     {"description", metadata.description},
                     {"icon", metadata.icon},
                     {"color", metadata.color},
                     {"rarity", metadata.rarity},
                     {"duration", metadata.duration.count()},
                     {"effect", metadata.effect}};
}

void from_json(const nlohmann::json& j, PowerUpMetadata& metadata) {
  j.at("type").get_to(metadata.type);
  j.at("name").get_to(metadata.name);
  j.at("description").get_to(metadata.description);
  j.at("icon").get_to(metadata.icon);
  j.at("color").get_to(metadata.color);
  j.at("rarity").get_to(metadata.rarity);
  metadata.duration = std::chrono::milliseconds(j.at("duration").get<int64_t>());
  j.at("effect").get_to(metadata.effect);
}

} // namespace brickforge
