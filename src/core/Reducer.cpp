#include "core/Reducer.hpp"

namespace brickfall::core {

namespace {

GameState withFallingBrick(const GameState& state, const FallingBrick& brick) {
    GameState next = state;
    next.fallingBrick = brick;
    return next;
}

GameState gameOver(const GameState& state) {
    GameState next = state;
    next.phase = GamePhase::Over;
    return next;
}

} // namespace

GameState startGame(IBrickSource& source) {
    GameState state = GameState::initial(source);
    state.phase = GamePhase::InProgress;
    return state;
}

GameState tickClock(const GameState& state, IBrickSource& source) {
    if (state.phase != GamePhase::InProgress) return state;

    if (state.isRowAnimating()) {
        return tickCompletedRowAnimation(state);
    }

    const FallingBrick brick = state.fallingBrick.isUnspawned()
        ? state.fallingBrick.spawned()
        : state.fallingBrick;

    if (auto fallen = brick.tickGravity(state.grid)) {
        return withFallingBrick(state, *fallen);
    }

    // Landed
    if (brick.isGameOver(state.grid)) {
        return gameOver(withFallingBrick(state, brick));
    }

    GameState next = writeFallingBrickToGrid(withFallingBrick(state, brick));
    next = dequeueNextBrick(next, source);
    if (!next.grid.hasCompletedRow()) return next;

    // Rows stay in place until the animation finishes
    return awardPoints(tickCompletedRowAnimation(next));
}

GameState apply(const GameState& state, Action action, IBrickSource& source) {
    if (action == Action::StartGame) {
        // Accepted in every phase; the previous session is discarded
        return startGame(source);
    }

    if (action == Action::TickClock) {
        return tickClock(state, source);
    }

    if (state.phase != GamePhase::InProgress) return state;

    const FallingBrick& brick = state.fallingBrick;
    switch (action) {
    case Action::Left:
        return withFallingBrick(state, brick.movedLeft(state.grid));
    case Action::Right:
        return withFallingBrick(state, brick.movedRight(state.grid));
    case Action::Up:
        return withFallingBrick(state, brick.rotated(state.grid));
    case Action::Down:
        // Hard drop only; the next clock tick locks the brick
        return withFallingBrick(state, brick.fastFallen(state.grid));
    default:
        return state;
    }
}

} // namespace brickfall::core
