#pragma once

#include "Types.hpp"
#include "BrickShape.hpp"
#include <array>
#include <vector>

namespace brickfall::core {

// Settled cells of the board, one row per entry, top row first.
class Grid {
public:
    using Row = std::array<Cell, GridWidth>;

    Grid();

    int rows() const noexcept { return static_cast<int>(rows_.size()); }
    int cols() const noexcept { return GridWidth; }

    const Row& row(int y) const;

    Cell cell(int x, int y) const;
    void setCell(int x, int y, Cell value);

    // True above the top of the board or on an EMPTY cell.
    // Columns outside the walls (at any height) and rows below the floor
    // are never empty.
    bool isEmpty(int x, int y) const noexcept;

    // True if any occupied cell of `shape` placed at (x0, y0) hits a
    // non-empty cell. Cells above the board collide only with the walls.
    bool collides(const BrickShape& shape, int x0, int y0) const noexcept;

    // Write the occupied cells of `shape` at (x0, y0) as `type`.
    // Cells that fall outside the board are skipped.
    void stamp(const BrickShape& shape, BrickType type, int x0, int y0);

    bool hasCompletedRow() const noexcept;
    int completedRowCount() const noexcept;

    // New grid without the complete rows; empty rows are added at the top.
    Grid withoutCompletedRows() const;

    bool operator==(const Grid& other) const noexcept { return rows_ == other.rows_; }
    bool operator!=(const Grid& other) const noexcept { return rows_ != other.rows_; }

    static Row emptyRow() { return Row{}; }

private:
    std::vector<Row> rows_;

    bool isInside(int x, int y) const noexcept {
        return y >= 0 && y < GridHeight && x >= 0 && x < GridWidth;
    }
};

bool isRowComplete(const Grid::Row& row) noexcept;

} // namespace brickfall::core
