#include "core/FallingBrick.hpp"

namespace brickfall::core {

FallingBrick::FallingBrick(BrickType type)
    : FallingBrick{type, UnspawnedPos, UnspawnedPos, Orientation::Spawn}
{
}

FallingBrick::FallingBrick(BrickType type, int x, int y, Orientation orientation)
    : type_{type}, x_{x}, y_{y}, orientation_{orientation}
{
}

BrickShape FallingBrick::shape() const noexcept {
    const BrickShape& canonical = canonicalShape(type_);
    if (isUnspawned() || type_ == BrickType::O) return canonical;
    return rotateShape(canonical, orientation_);
}

FallingBrick FallingBrick::spawned() const noexcept {
    const int size = shape().size();
    // (GridWidth - size) is never negative, so integer division floors
    return FallingBrick{type_, (GridWidth - size) / 2, -size, Orientation::Spawn};
}

bool FallingBrick::isTouchingFloor() const noexcept {
    const BrickShape s = shape();
    for (int y = s.size() - 1; y >= 0; --y) {
        if (s.isEmptyRow(y)) continue; // lowest occupied row decides
        return y_ + y + 1 >= GridHeight;
    }
    return false;
}

bool FallingBrick::isOnTopOfBricks(const Grid& grid) const noexcept {
    return grid.collides(shape(), x_, y_ + 1);
}

bool FallingBrick::canFall(const Grid& grid) const noexcept {
    return !isTouchingFloor() && !isOnTopOfBricks(grid);
}

std::optional<FallingBrick> FallingBrick::tickGravity(const Grid& grid) const noexcept {
    if (!canFall(grid)) return std::nullopt;
    return FallingBrick{type_, x_, y_ + 1, orientation_};
}

bool FallingBrick::isGameOver(const Grid& grid) const noexcept {
    if (isUnspawned() || !isOnTopOfBricks(grid)) return false;

    const BrickShape s = shape();
    for (int y = 0; y < s.size(); ++y) {
        if (!s.isEmptyRow(y) && y_ + y < 0) return true;
    }
    return false;
}

FallingBrick FallingBrick::rotated(const Grid& grid) const noexcept {
    if (isUnspawned() || type_ == BrickType::O) return *this;

    const Orientation next = nextOrientation(orientation_);
    const BrickShape nextShape = rotateShape(canonicalShape(type_), next);

    for (const KickOffset& kick : wallKicks(kickTableFor(type_), orientation_)) {
        if (!grid.collides(nextShape, x_ + kick.dx, y_ + kick.dy)) {
            return FallingBrick{type_, x_ + kick.dx, y_ + kick.dy, next};
        }
    }

    // No kick fits: rotation rejected
    return *this;
}

bool FallingBrick::isAgainstWall(bool left) const noexcept {
    const BrickShape s = shape();
    const int bound = left ? 0 : GridWidth - 1;
    for (int y = 0; y < s.size(); ++y) {
        for (int x = 0; x < s.size(); ++x) {
            if (s.at(y, x) && x_ + x == bound) return true;
        }
    }
    return false;
}

bool FallingBrick::canMove(const Grid& grid, bool left) const noexcept {
    return !isAgainstWall(left)
        && !grid.collides(shape(), x_ + (left ? -1 : 1), y_);
}

FallingBrick FallingBrick::movedLeft(const Grid& grid) const noexcept {
    if (isUnspawned() || !canMove(grid, true)) return *this;
    return FallingBrick{type_, x_ - 1, y_, orientation_};
}

FallingBrick FallingBrick::movedRight(const Grid& grid) const noexcept {
    if (isUnspawned() || !canMove(grid, false)) return *this;
    return FallingBrick{type_, x_ + 1, y_, orientation_};
}

FallingBrick FallingBrick::fastFallen(const Grid& grid) const noexcept {
    if (isUnspawned()) return *this;

    FallingBrick dropped = *this;
    while (auto next = dropped.tickGravity(grid)) {
        dropped = *next;
    }
    return dropped;
}

bool FallingBrick::operator==(const FallingBrick& other) const noexcept {
    return type_ == other.type_
        && x_ == other.x_
        && y_ == other.y_
        && orientation_ == other.orientation_;
}

} // namespace brickfall::core
