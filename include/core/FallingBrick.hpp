#pragma once // Include guard

#include "Types.hpp"      // For BrickType, Orientation
#include "BrickShape.hpp" // For BrickShape
#include "Grid.hpp"       // For Grid
#include <limits>         // For the unspawned sentinel
#include <optional>

// Namespace for brickfall core types
namespace brickfall::core {

// The brick currently under the player's control.
// Immutable value: every move returns a new brick, the original is untouched.
// Invalid moves (walls, settled cells, unspawned brick) return an equal brick.
class FallingBrick {
public:
    // Position of a brick that has not been placed on the board yet
    static constexpr int UnspawnedPos = std::numeric_limits<int>::min();

    explicit FallingBrick(BrickType type);
    FallingBrick(BrickType type, int x, int y, Orientation orientation);

    BrickType type() const noexcept { return type_; }
    int x() const noexcept { return x_; }
    int y() const noexcept { return y_; }
    Orientation orientation() const noexcept { return orientation_; }

    bool isUnspawned() const noexcept { return x_ == UnspawnedPos; }

    // Shape after applying the rotation (canonical for unspawned or O bricks)
    BrickShape shape() const noexcept;

    // Centered horizontally, fully above the visible board
    FallingBrick spawned() const noexcept;

    bool canFall(const Grid& grid) const noexcept;

    // One row down, or std::nullopt when the brick has landed
    std::optional<FallingBrick> tickGravity(const Grid& grid) const noexcept;

    // Landed on settled cells while part of it is still above row 0
    bool isGameOver(const Grid& grid) const noexcept;

    FallingBrick rotated(const Grid& grid) const noexcept;
    FallingBrick movedLeft(const Grid& grid) const noexcept;
    FallingBrick movedRight(const Grid& grid) const noexcept;

    // Hard drop: lowest legal position. Does not lock the brick.
    FallingBrick fastFallen(const Grid& grid) const noexcept;

    bool operator==(const FallingBrick& other) const noexcept;
    bool operator!=(const FallingBrick& other) const noexcept { return !(*this == other); }

private:
    BrickType type_;
    int x_;
    int y_;
    Orientation orientation_;

    bool isTouchingFloor() const noexcept;
    bool isOnTopOfBricks(const Grid& grid) const noexcept;
    bool isAgainstWall(bool left) const noexcept;
    bool canMove(const Grid& grid, bool left) const noexcept;
};

} // namespace brickfall::core
