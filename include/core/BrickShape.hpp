#pragma once // Include guard

#include "Types.hpp" // For BrickType, Orientation
#include <array>     // For std::array

// Namespace for brickfall core types
namespace brickfall::core {

// Square bit-matrix (2x2, 3x3 or 4x4) of the cells a brick occupies.
// Index order is (row, col), row 0 at the top.
class BrickShape {
public:
    static constexpr int MaxSize = 4;

    using Bits = std::array<std::array<bool, MaxSize>, MaxSize>;

    BrickShape(int size, const Bits& bits);

    int size() const noexcept { return size_; }

    bool at(int row, int col) const noexcept { return bits_[row][col]; }
    void set(int row, int col, bool occupied) noexcept { bits_[row][col] = occupied; }

    bool isEmptyRow(int row) const noexcept;

    bool operator==(const BrickShape& other) const noexcept;
    bool operator!=(const BrickShape& other) const noexcept { return !(*this == other); }

private:
    int size_;
    Bits bits_;
};

// Spawn-orientation shape for a brick type. The table is immutable.
const BrickShape& canonicalShape(BrickType type) noexcept;

// Brute-force clockwise rotation of a bounding box, applied `orientation` times
// to a copy of `shape`.
BrickShape rotateShape(const BrickShape& shape, Orientation orientation) noexcept;

// Super Rotation System kick offsets, keyed by the orientation rotated FROM.
struct KickOffset {
    int dx{};
    int dy{};
};

constexpr int KickCount = 5;

using WallKickList = std::array<KickOffset, KickCount>;

// Which kick table a brick uses. O never rotates so it has none.
enum class KickTable : std::uint8_t {
    I,
    JLSTZ
};

const WallKickList& wallKicks(KickTable table, Orientation from) noexcept;

// I uses its own table; J, L, S, T, Z share the other one.
inline KickTable kickTableFor(BrickType type) noexcept {
    return type == BrickType::I ? KickTable::I : KickTable::JLSTZ;
}

} // namespace brickfall::core
