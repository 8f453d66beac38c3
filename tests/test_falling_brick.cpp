#include <catch2/catch.hpp>

#include <initializer_list>

#include "core/FallingBrick.hpp"
#include "core/Grid.hpp"
#include "core/Types.hpp"

using namespace brickfall::core;

TEST_CASE("Unspawned brick ignores every move", "[brick]") {
    Grid grid;
    const FallingBrick brick{BrickType::T};

    REQUIRE(brick.isUnspawned());
    REQUIRE(brick.shape() == canonicalShape(BrickType::T));
    REQUIRE(brick.movedLeft(grid) == brick);
    REQUIRE(brick.movedRight(grid) == brick);
    REQUIRE(brick.rotated(grid) == brick);
    REQUIRE(brick.fastFallen(grid) == brick);
    REQUIRE_FALSE(brick.isGameOver(grid));
}

TEST_CASE("Spawn centers the brick fully above the board", "[brick]") {
    const FallingBrick t = FallingBrick{BrickType::T}.spawned();
    REQUIRE_FALSE(t.isUnspawned());
    REQUIRE(t.x() == 3);
    REQUIRE(t.y() == -3);
    REQUIRE(t.orientation() == Orientation::Spawn);

    const FallingBrick i = FallingBrick{BrickType::I}.spawned();
    REQUIRE(i.x() == 3);
    REQUIRE(i.y() == -4);

    const FallingBrick o = FallingBrick{BrickType::O}.spawned();
    REQUIRE(o.x() == 4);
    REQUIRE(o.y() == -2);
}

TEST_CASE("Gravity moves the brick one row until it lands", "[brick]") {
    Grid grid;
    const FallingBrick t = FallingBrick{BrickType::T}.spawned();

    auto fallen = t.tickGravity(grid);
    REQUIRE(fallen.has_value());
    REQUIRE(fallen->x() == 3);
    REQUIRE(fallen->y() == -2);
    REQUIRE(t.y() == -3); // original value untouched

    // T's lowest occupied row is its second one
    const FallingBrick nearFloor{BrickType::T, 3, 17, Orientation::Spawn};
    REQUIRE(nearFloor.canFall(grid));
    const FallingBrick onFloor{BrickType::T, 3, 18, Orientation::Spawn};
    REQUIRE_FALSE(onFloor.canFall(grid));
    REQUIRE_FALSE(onFloor.tickGravity(grid).has_value());
}

TEST_CASE("Gravity stops on settled cells", "[brick]") {
    Grid grid;
    grid.setCell(4, 10, BrickType::O);

    // T flat row at y + 1 lands on (4, 10)
    const FallingBrick t{BrickType::T, 3, 8, Orientation::Spawn};
    REQUIRE_FALSE(t.canFall(grid));

    const FallingBrick higher{BrickType::T, 3, 7, Orientation::Spawn};
    REQUIRE(higher.canFall(grid));
}

TEST_CASE("Hard drop reaches the lowest position and is idempotent", "[brick]") {
    Grid grid;

    for (BrickType type : AllBrickTypes) {
        const FallingBrick brick = FallingBrick{type}.spawned();
        const FallingBrick dropped = brick.fastFallen(grid);

        REQUIRE_FALSE(dropped.canFall(grid));
        REQUIRE(dropped.x() == brick.x());
        REQUIRE(dropped.fastFallen(grid) == dropped);
    }

    REQUIRE(FallingBrick{BrickType::I}.spawned().fastFallen(grid).y() == 18);
    REQUIRE(FallingBrick{BrickType::O}.spawned().fastFallen(grid).y() == 18);
    REQUIRE(FallingBrick{BrickType::T}.spawned().fastFallen(grid).y() == 18);

    grid.setCell(4, 12, BrickType::Z);
    REQUIRE(FallingBrick{BrickType::O}.spawned().fastFallen(grid).y() == 10);
}

TEST_CASE("Side moves stop at the walls", "[brick]") {
    Grid grid;
    FallingBrick t = FallingBrick{BrickType::T}.spawned();

    for (int i = 0; i < 3; ++i) {
        t = t.movedLeft(grid);
    }
    REQUIRE(t.x() == 0);
    REQUIRE(t.movedLeft(grid) == t);

    for (int i = 0; i < 7; ++i) {
        t = t.movedRight(grid);
    }
    REQUIRE(t.x() == 7);
    REQUIRE(t.movedRight(grid) == t);
    REQUIRE(t.y() == -3);
}

TEST_CASE("Side moves stop at settled cells", "[brick]") {
    Grid grid;
    grid.setCell(2, 18, BrickType::S);

    const FallingBrick t{BrickType::T, 3, 17, Orientation::Spawn};
    REQUIRE(t.movedLeft(grid) == t);

    const FallingBrick moved = t.movedRight(grid);
    REQUIRE(moved.x() == 4);
    REQUIRE(moved.y() == 17);
}

TEST_CASE("Rotation in open space keeps the position and cycles orientation", "[brick]") {
    Grid grid;

    for (BrickType type : AllBrickTypes) {
        if (type == BrickType::O) continue;

        const FallingBrick start{type, 3, 5, Orientation::Spawn};
        FallingBrick b = start;
        for (int i = 0; i < 4; ++i) {
            const FallingBrick next = b.rotated(grid);
            REQUIRE(next.orientation() == nextOrientation(b.orientation()));
            REQUIRE(next.x() == 3);
            REQUIRE(next.y() == 5);
            REQUIRE(next.shape() == rotateShape(canonicalShape(type), next.orientation()));
            b = next;
        }
        REQUIRE(b == start);
    }
}

TEST_CASE("O never rotates", "[brick]") {
    Grid grid;
    const FallingBrick o = FallingBrick{BrickType::O}.spawned();
    REQUIRE(o.rotated(grid) == o);

    for (Orientation orientation : {Orientation::Right, Orientation::Two, Orientation::Left}) {
        const FallingBrick turned{BrickType::O, 4, 5, orientation};
        REQUIRE(turned.shape() == canonicalShape(BrickType::O));
    }
}

TEST_CASE("Rotation against a wall uses the first kick that fits", "[brick]") {
    Grid grid;

    // Right-facing T hugging the left wall: its flat orientation would poke through
    const FallingBrick t{BrickType::T, -1, 5, Orientation::Right};
    const FallingBrick rotated = t.rotated(grid);

    REQUIRE(rotated.orientation() == Orientation::Two);
    REQUIRE(rotated.x() == 0);
    REQUIRE(rotated.y() == 5);
}

TEST_CASE("Rotation is rejected when no kick fits", "[brick]") {
    Grid grid;
    for (int y = 10; y < GridHeight; ++y) {
        for (int x = 0; x < GridWidth; ++x) {
            grid.setCell(x, y, BrickType::Z);
        }
    }

    // Carve out exactly the cells of a flat T resting on the floor at the left wall
    const FallingBrick t{BrickType::T, 0, 18, Orientation::Spawn};
    grid.setCell(1, 18, std::nullopt);
    grid.setCell(0, 19, std::nullopt);
    grid.setCell(1, 19, std::nullopt);
    grid.setCell(2, 19, std::nullopt);

    REQUIRE(t.rotated(grid) == t);
}

TEST_CASE("Game over only when landing with cells above the board", "[brick]") {
    Grid grid;
    grid.setCell(3, 0, BrickType::L);
    grid.setCell(4, 0, BrickType::L);
    grid.setCell(5, 0, BrickType::L);

    FallingBrick t = FallingBrick{BrickType::T}.spawned();
    t = *t.tickGravity(grid);
    REQUIRE(t.y() == -2);
    REQUIRE_FALSE(t.canFall(grid));
    REQUIRE(t.isGameOver(grid));

    SECTION("landing on the floor is not game over") {
        const FallingBrick dropped = FallingBrick{BrickType::T}.spawned().fastFallen(Grid{});
        REQUIRE_FALSE(dropped.isGameOver(Grid{}));
    }

    SECTION("an I whose empty top row is above the board is still fully on it") {
        Grid g;
        for (int x = 3; x < 7; ++x) {
            g.setCell(x, 1, BrickType::O);
        }
        const FallingBrick i{BrickType::I, 3, -1, Orientation::Spawn};
        REQUIRE_FALSE(i.canFall(g));
        REQUIRE_FALSE(i.isGameOver(g));
    }
}

TEST_CASE("Walls stay solid above the board when kicking", "[brick]") {
    Grid grid;

    // Right-facing I hugging the left wall, fully above the board
    const FallingBrick i{BrickType::I, -2, -4, Orientation::Right};
    const FallingBrick rotated = i.rotated(grid);

    // The flat I at x = -2 would stick out of the wall; the (2, 0) kick applies
    REQUIRE(rotated.orientation() == Orientation::Two);
    REQUIRE(rotated.x() == 0);
    REQUIRE(rotated.y() == -4);
}
