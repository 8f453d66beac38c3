#include "core/BrickShape.hpp"

namespace brickfall::core {

BrickShape::BrickShape(int size, const Bits& bits)
    : size_{size}, bits_{bits}
{
}

bool BrickShape::isEmptyRow(int row) const noexcept {
    for (int col = 0; col < size_; ++col) {
        if (bits_[row][col]) return false;
    }
    return true;
}

bool BrickShape::operator==(const BrickShape& other) const noexcept {
    if (size_ != other.size_) return false;
    for (int row = 0; row < size_; ++row) {
        for (int col = 0; col < size_; ++col) {
            if (bits_[row][col] != other.bits_[row][col]) return false;
        }
    }
    return true;
}

namespace {

using B = BrickShape::Bits;

const BrickShape ShapeI{4, B{{
    {false, false, false, false},
    {true,  true,  true,  true },
    {false, false, false, false},
    {false, false, false, false}
}}};

// [ ]
// [ ][ ][ ]
const BrickShape ShapeL{3, B{{
    {true,  false, false, false},
    {true,  true,  true,  false},
    {false, false, false, false},
    {false, false, false, false}
}}};

//       [ ]
// [ ][ ][ ]
const BrickShape ShapeJ{3, B{{
    {false, false, true,  false},
    {true,  true,  true,  false},
    {false, false, false, false},
    {false, false, false, false}
}}};

const BrickShape ShapeO{2, B{{
    {true,  true,  false, false},
    {true,  true,  false, false},
    {false, false, false, false},
    {false, false, false, false}
}}};

//    [ ][ ]
// [ ][ ]
const BrickShape ShapeS{3, B{{
    {false, true,  true,  false},
    {true,  true,  false, false},
    {false, false, false, false},
    {false, false, false, false}
}}};

// [ ][ ]
//    [ ][ ]
const BrickShape ShapeZ{3, B{{
    {true,  true,  false, false},
    {false, true,  true,  false},
    {false, false, false, false},
    {false, false, false, false}
}}};

//    [ ]
// [ ][ ][ ]
const BrickShape ShapeT{3, B{{
    {false, true,  false, false},
    {true,  true,  true,  false},
    {false, false, false, false},
    {false, false, false, false}
}}};

// Based on https://tetris.wiki/Super_Rotation_System, applied as (x + dx, y + dy)
// in board coordinates.
const std::array<WallKickList, 4> JlstzKicks{{
    // 0 -> R
    {{{0, 0}, {-1, 0}, {-1,  1}, {0, -2}, {-1, -2}}},
    // R -> 2
    {{{0, 0}, { 1, 0}, { 1, -1}, {0,  2}, { 1,  2}}},
    // 2 -> L
    {{{0, 0}, { 1, 0}, { 1,  1}, {0, -2}, { 1, -2}}},
    // L -> 0
    {{{0, 0}, {-1, 0}, {-1, -1}, {0,  2}, {-1,  2}}}
}};

const std::array<WallKickList, 4> IKicks{{
    // 0 -> R
    {{{0, 0}, {-2, 0}, { 1, 0}, {-2, -1}, { 1,  2}}},
    // R -> 2
    {{{0, 0}, {-1, 0}, { 2, 0}, {-1,  2}, { 2, -1}}},
    // 2 -> L
    {{{0, 0}, { 2, 0}, {-1, 0}, { 2,  1}, {-1, -2}}},
    // L -> 0
    {{{0, 0}, { 1, 0}, {-2, 0}, { 1, -2}, {-2,  1}}}
}};

} // namespace

const BrickShape& canonicalShape(BrickType type) noexcept {
    switch (type) {
    case BrickType::I: return ShapeI;
    case BrickType::L: return ShapeL;
    case BrickType::J: return ShapeJ;
    case BrickType::O: return ShapeO;
    case BrickType::S: return ShapeS;
    case BrickType::Z: return ShapeZ;
    case BrickType::T: return ShapeT;
    }

    // Fallback (should never happen)
    return ShapeO;
}

BrickShape rotateShape(const BrickShape& shape, Orientation orientation) noexcept {
    const int size = shape.size();
    const int turns = static_cast<int>(orientation);

    BrickShape prev = shape;
    BrickShape cur = shape;
    for (int i = 0; i < turns; ++i) {
        for (int x = 0; x < size; ++x) {
            for (int y = 0; y < size; ++y) {
                cur.set(x, size - 1 - y, prev.at(y, x));
            }
        }
        prev = cur;
    }
    return cur;
}

const WallKickList& wallKicks(KickTable table, Orientation from) noexcept {
    const auto index = static_cast<std::size_t>(from);
    return table == KickTable::I ? IKicks[index] : JlstzKicks[index];
}

} // namespace brickfall::core
