#include "brickforge/core/GameState.hh"
#include "brickforge/core/Log.hh"

#include <utility>

namespace brickforge {

GameSnapshot captureSnapshot(const GameState& state) {
    GameSnapshot snapshot;
    snapshot.balls = state.balls();
    snapshot.paddle = state.paddle();
    snapshot.blocks = state.blocks();
    return snapshot;
}

void restoreSnapshot(GameState& state, const GameSnapshot& snapshot) {
    state.balls() = snapshot.balls;
    state.paddle() = snapshot.paddle;
    state.blocks() = snapshot.blocks;
}

EffectPatch EffectPatch::between(std::string source, const GameSnapshot& before, const GameSnapshot& after) {
    EffectPatch patch;
    patch.source = std::move(source);

    if (before.balls != after.balls) {
        patch.balls = StateChange<std::vector<Ball>>{before.balls, after.balls};
    }
    if (before.paddle != after.paddle) {
        patch.paddle = StateChange<Paddle>{before.paddle, after.paddle};
    }
    if (before.blocks != after.blocks) {
        patch.blocks = StateChange<std::vector<Block>>{before.blocks, after.blocks};
    }

    return patch;
}

bool EffectPatch::empty() const {
    return !balls && !paddle && !blocks;
}

void EffectPatch::apply(GameState& state) const {
    if (balls) {
        state.balls() = balls->after;
    }
    if (paddle) {
        state.paddle() = paddle->after;
    }
    if (blocks) {
        state.blocks() = blocks->after;
    }
    BRICKFORGE_LOG_DEBUG("Applied patch from '{}'", source);
}

void EffectPatch::revert(GameState& state) const {
    if (balls) {
        state.balls() = balls->before;
    }
    if (paddle) {
        state.paddle() = paddle->before;
    }
    if (blocks) {
        state.blocks() = blocks->before;
    }
    BRICKFORGE_LOG_DEBUG("Reverted patch from '{}'", source);
}

} // namespace brickforge
