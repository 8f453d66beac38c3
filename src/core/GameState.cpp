#include "core/GameState.hpp"

namespace brickfall::core {

GameState GameState::initial(IBrickSource& source) {
    // Falling brick is drawn before the queue
    const FallingBrick brick{source.next()};

    BrickQueue queue{};
    for (auto& type : queue) {
        type = source.next();
    }

    return GameState{GamePhase::Unstarted, Grid{}, 0, brick, queue, std::nullopt};
}

GameState dequeueNextBrick(const GameState& state, IBrickSource& source) {
    GameState next = state;
    next.fallingBrick = FallingBrick{state.queue.front()};
    for (std::size_t i = 1; i < state.queue.size(); ++i) {
        next.queue[i - 1] = state.queue[i];
    }
    next.queue.back() = source.next();
    return next;
}

GameState writeFallingBrickToGrid(const GameState& state) {
    GameState next = state;
    const FallingBrick& brick = state.fallingBrick;
    next.grid.stamp(brick.shape(), brick.type(), brick.x(), brick.y());
    return next;
}

GameState awardPoints(const GameState& state) {
    GameState next = state;
    next.score += static_cast<std::uint64_t>(state.grid.completedRowCount()) * PointsPerRow;
    return next;
}

GameState tickCompletedRowAnimation(const GameState& state) {
    GameState next = state;
    if (!state.isRowAnimating()) {
        next.completedRowAnimationFrame = 0;
        return next;
    }

    const int frame = *state.completedRowAnimationFrame + 1;
    if (frame < RowAnimationFrames) {
        next.completedRowAnimationFrame = frame;
        return next;
    }

    next.completedRowAnimationFrame.reset();
    next.grid = state.grid.withoutCompletedRows();
    return next;
}

} // namespace brickfall::core
