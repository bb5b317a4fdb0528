#pragma once

#include "brickforge/core/PowerUp.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace brickforge {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vec2&) const = default;
};

struct Ball {
    std::string id;
    Vec2 position;
    Vec2 velocity;
    double radius = 0.0;
    bool active = true;

    bool operator==(const Ball&) const = default;
};

struct Paddle {
    Vec2 position;
    double width = 0.0;
    double height = 0.0;
    double speed = 0.0;
    bool active = true;

    bool operator==(const Paddle&) const = default;
};

struct Block {
    std::string id;
    Vec2 position;
    double width = 0.0;
    double height = 0.0;
    int32_t hitPoints = 1;
    bool destroyed = false;

    bool operator==(const Block&) const = default;
};

// An effect currently applied in the session, as tracked by the host's
// power-up coordination system.
struct ActivePowerUp {
    std::string id;
    PowerUpType type = PowerUpType::MultiBall;
    std::string pluginName;
    int32_t priority = 0;
    double remainingMs = 0.0;

    bool operator==(const ActivePowerUp&) const = default;
};

// The slice of game state plugins may read and mutate. Implemented by the
// host; the plugin core only forwards it to plugin hooks.
class GameState {
  public:
    virtual ~GameState() = default;

    virtual std::vector<Ball>& balls() = 0;
    virtual const std::vector<Ball>& balls() const = 0;

    virtual Paddle& paddle() = 0;
    virtual const Paddle& paddle() const = 0;

    virtual std::vector<Block>& blocks() = 0;
    virtual const std::vector<Block>& blocks() const = 0;

    virtual const std::vector<ActivePowerUp>& activePowerUps() const = 0;
};

// Value copy of the mutable entity groups of a GameState.
struct GameSnapshot {
    std::vector<Ball> balls;
    Paddle paddle;
    std::vector<Block> blocks;

    bool operator==(const GameSnapshot&) const = default;
};

GameSnapshot captureSnapshot(const GameState& state);
void restoreSnapshot(GameState& state, const GameSnapshot& snapshot);

template <typename T> struct StateChange {
    T before;
    T after;

    bool operator==(const StateChange&) const = default;
};

// Reversible record of what one effect changed. Only entity groups that
// differ between the two snapshots are stored, so reverting a patch leaves
// groups touched by other effects alone.
struct EffectPatch {
    std::string source;
    std::optional<StateChange<std::vector<Ball>>> balls;
    std::optional<StateChange<Paddle>> paddle;
    std::optional<StateChange<std::vector<Block>>> blocks;

    static EffectPatch between(std::string source, const GameSnapshot& before, const GameSnapshot& after);

    bool empty() const;

    // Writes the "after" side of every stored group.
    void apply(GameState& state) const;

    // Writes the "before" side of every stored group.
    void revert(GameState& state) const;

    bool operator==(const EffectPatch&) const = default;
};

} // namespace brickforge
