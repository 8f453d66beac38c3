#include "core/Grid.hpp"
#include <algorithm>
#include <stdexcept>

namespace brickfall::core {

bool isRowComplete(const Grid::Row& row) noexcept {
    return std::all_of(row.begin(), row.end(),
                       [](const Cell& c) { return c.has_value(); });
}

Grid::Grid()
    : rows_(GridHeight, emptyRow())
{
}

const Grid::Row& Grid::row(int y) const {
    if (y < 0 || y >= GridHeight) {
        throw std::out_of_range("Grid::row out of range");
    }
    return rows_[y];
}

Cell Grid::cell(int x, int y) const {
    if (!isInside(x, y)) {
        throw std::out_of_range("Grid::cell out of range");
    }
    return rows_[y][x];
}

void Grid::setCell(int x, int y, Cell value) {
    if (!isInside(x, y)) {
        throw std::out_of_range("Grid::setCell out of range");
    }
    rows_[y][x] = value;
}

bool Grid::isEmpty(int x, int y) const noexcept {
    if (x < 0 || x >= GridWidth) return false; // walls extend above the board
    if (y < 0) return true;  // spawn area
    if (y >= GridHeight) return false; // floor
    return !rows_[y][x].has_value();
}

bool Grid::collides(const BrickShape& shape, int x0, int y0) const noexcept {
    const int size = shape.size();
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            if (shape.at(y, x) && !isEmpty(x0 + x, y0 + y)) {
                return true;
            }
        }
    }
    return false;
}

void Grid::stamp(const BrickShape& shape, BrickType type, int x0, int y0) {
    const int size = shape.size();
    for (int y = 0; y < size; ++y) {
        if (shape.isEmptyRow(y)) continue;
        for (int x = 0; x < size; ++x) {
            if (!shape.at(y, x) || !isInside(x0 + x, y0 + y)) continue;
            Cell& target = rows_[y0 + y][x0 + x];
            if (!target) {
                target = type;
            }
        }
    }
}

bool Grid::hasCompletedRow() const noexcept {
    return std::any_of(rows_.begin(), rows_.end(),
                       [](const Row& r) { return isRowComplete(r); });
}

int Grid::completedRowCount() const noexcept {
    return static_cast<int>(std::count_if(rows_.begin(), rows_.end(),
                                          [](const Row& r) { return isRowComplete(r); }));
}

Grid Grid::withoutCompletedRows() const {
    std::vector<Row> remaining;
    remaining.reserve(rows_.size());
    for (const auto& r : rows_) {
        if (!isRowComplete(r)) remaining.push_back(r);
    }

    Grid result;
    result.rows_.assign(GridHeight - remaining.size(), emptyRow());
    result.rows_.insert(result.rows_.end(), remaining.begin(), remaining.end());
    return result;
}

} // namespace brickfall::core
