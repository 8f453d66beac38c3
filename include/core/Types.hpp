#pragma once // Include guard

#include <array>    // For std::array
#include <cstdint>  // For fixed-width integer types
#include <optional> // For Cell

// Namespace for brickfall core types
namespace brickfall::core {

// Board dimensions (fixed; index (0,0) is top-left)
constexpr int GridWidth  = 10;
constexpr int GridHeight = 20;

constexpr int QueueSize = 4;

// Clock ticks per second driving gravity
constexpr double DefaultTicksPerSecond = 7.5;

// Row-clear animation: total frames, and frames per blink phase
constexpr int RowAnimationFrames   = 6;
constexpr int RowAnimationInterval = 2;

constexpr int PointsPerRow = 100;

// The 7 canonical brick types
enum class BrickType : std::uint8_t {
    I, L, J, O, S, Z, T
};

constexpr int BrickTypeCount = 7;

constexpr std::array<BrickType, BrickTypeCount> AllBrickTypes{{
    BrickType::I, BrickType::L, BrickType::J, BrickType::O,
    BrickType::S, BrickType::Z, BrickType::T
}};

// Rotation states, clockwise from the spawn orientation
enum class Orientation : std::uint8_t {
    Spawn = 0,
    Right = 1,
    Two   = 2,
    Left  = 3
};

// Function to get the next orientation in a clockwise direction
inline Orientation nextOrientation(Orientation o) {
    return static_cast<Orientation>((static_cast<std::uint8_t>(o) + 1U) % 4U);
}

// A settled cell: empty, or the type of the brick that filled it
using Cell = std::optional<BrickType>;

// Phase of the outer game state machine
enum class GamePhase : std::uint8_t {
    Unstarted,
    InProgress,
    Over
};

// Actions folded through the reducer
enum class Action : std::uint8_t {
    TickClock,
    StartGame,
    Down,
    Left,
    Right,
    Up
};

} // namespace brickfall::core
