#pragma once

#include "Types.hpp"
#include "Grid.hpp"
#include "FallingBrick.hpp"
#include "BrickSource.hpp"
#include <array>
#include <cstdint>
#include <optional>

namespace brickfall::core {

// Upcoming brick types, front first. Always exactly QueueSize long.
using BrickQueue = std::array<BrickType, QueueSize>;

// Snapshot of one game session. Produced by the reducer, read by presenters.
struct GameState {
    GamePhase phase{GamePhase::Unstarted};
    Grid grid{};
    std::uint64_t score{0};
    FallingBrick fallingBrick;
    BrickQueue queue;

    // Present while complete rows are blinking before removal
    std::optional<int> completedRowAnimationFrame{};

    bool isRowAnimating() const noexcept { return completedRowAnimationFrame.has_value(); }

    bool operator==(const GameState& other) const noexcept {
        return phase == other.phase
            && grid == other.grid
            && score == other.score
            && fallingBrick == other.fallingBrick
            && queue == other.queue
            && completedRowAnimationFrame == other.completedRowAnimationFrame;
    }
    bool operator!=(const GameState& other) const noexcept { return !(*this == other); }

    // Fresh session in the Unstarted phase: empty grid, random brick and queue
    static GameState initial(IBrickSource& source);
};

// Pop the queue front into a new unspawned falling brick and append one
// fresh type, keeping the queue length.
GameState dequeueNextBrick(const GameState& state, IBrickSource& source);

// Lock the falling brick into the grid at its current position.
GameState writeFallingBrickToGrid(const GameState& state);

// 100 points for each complete row currently in the grid.
GameState awardPoints(const GameState& state);

// Start the animation, or advance it. Reaching the last frame clears the
// counter and removes the complete rows in the same step.
GameState tickCompletedRowAnimation(const GameState& state);

} // namespace brickfall::core
