#include "core/Tetromino.hpp"

#include <algorithm>

namespace stackfall::core {

namespace {

using S = Tetromino::Shape;

// Indexed by [TetrominoType][Rotation]. Offsets are {row, col}, rows grow downwards.
// J/L/S/T/Z pivot on the center of a 3x3 box, I on cell (1,1) of a 4x4 box.
constexpr std::array<std::array<S, 4>, TetrominoTypeCount> kShapes{{
    // I
    {{
        S{{ {0, -1}, {0, 0}, {0, 1}, {0, 2} }},   // [ ][ ][ ][ ]
        S{{ {-1, 1}, {0, 1}, {1, 1}, {2, 1} }},
        S{{ {1, -1}, {1, 0}, {1, 1}, {1, 2} }},
        S{{ {-1, 0}, {0, 0}, {1, 0}, {2, 0} }},
    }},
    // O: same in all rotations
    {{
        S{{ {-1, 0}, {-1, 1}, {0, 0}, {0, 1} }},
        S{{ {-1, 0}, {-1, 1}, {0, 0}, {0, 1} }},
        S{{ {-1, 0}, {-1, 1}, {0, 0}, {0, 1} }},
        S{{ {-1, 0}, {-1, 1}, {0, 0}, {0, 1} }},
    }},
    // T
    {{
        //   [ ]
        // [ ][T][ ]
        S{{ {-1, 0}, {0, -1}, {0, 0}, {0, 1} }},
        // [ ]
        // [T][ ]
        // [ ]
        S{{ {-1, 0}, {0, 0}, {0, 1}, {1, 0} }},
        // [ ][T][ ]
        //   [ ]
        S{{ {0, -1}, {0, 0}, {0, 1}, {1, 0} }},
        //   [ ]
        // [ ][T]
        //   [ ]
        S{{ {-1, 0}, {0, -1}, {0, 0}, {1, 0} }},
    }},
    // L
    {{
        //     [ ]
        // [ ][L][ ]
        S{{ {-1, 1}, {0, -1}, {0, 0}, {0, 1} }},
        S{{ {-1, 0}, {0, 0}, {1, 0}, {1, 1} }},
        S{{ {0, -1}, {0, 0}, {0, 1}, {1, -1} }},
        S{{ {-1, -1}, {-1, 0}, {0, 0}, {1, 0} }},
    }},
    // J
    {{
        // [ ]
        // [ ][J][ ]
        S{{ {-1, -1}, {0, -1}, {0, 0}, {0, 1} }},
        S{{ {-1, 0}, {-1, 1}, {0, 0}, {1, 0} }},
        S{{ {0, -1}, {0, 0}, {0, 1}, {1, 1} }},
        S{{ {-1, 0}, {0, 0}, {1, -1}, {1, 0} }},
    }},
    // S
    {{
        //   [ ][ ]
        // [ ][S]
        S{{ {-1, 0}, {-1, 1}, {0, -1}, {0, 0} }},
        S{{ {-1, 0}, {0, 0}, {0, 1}, {1, 1} }},
        S{{ {0, 0}, {0, 1}, {1, -1}, {1, 0} }},
        S{{ {-1, -1}, {0, -1}, {0, 0}, {1, 0} }},
    }},
    // Z
    {{
        // [ ][ ]
        //   [Z][ ]
        S{{ {-1, -1}, {-1, 0}, {0, 0}, {0, 1} }},
        S{{ {-1, 1}, {0, 0}, {0, 1}, {1, 0} }},
        S{{ {0, -1}, {0, 0}, {1, 0}, {1, 1} }},
        S{{ {-1, 0}, {0, -1}, {0, 0}, {1, -1} }},
    }},
}};

} // namespace

Tetromino::Tetromino(TetrominoType type, Rotation rotation, Position origin)
    : type_{type}, rotation_{rotation}, origin_{origin}
{
}

Tetromino Tetromino::shifted(int dRow, int dCol) const noexcept {
    Tetromino moved = *this;
    moved.origin_.row += dRow;
    moved.origin_.col += dCol;
    return moved;
}

Tetromino::Shape Tetromino::blocks() const noexcept {
    const Shape& rel = shapeFor(type_, rotation_);
    Shape abs{};
    for (int i = 0; i < BlockCount; ++i) {
        abs[i].row = origin_.row + rel[i].row;
        abs[i].col = origin_.col + rel[i].col;
    }
    return abs;
}

const Tetromino::Shape& Tetromino::shapeFor(TetrominoType type, Rotation rotation) noexcept {
    return kShapes[static_cast<std::size_t>(type)][static_cast<std::size_t>(rotation)];
}

Tetromino Tetromino::spawn(TetrominoType type, int boardCols, int topRow) noexcept {
    const Shape& rel = shapeFor(type, Rotation::R0);
    int minRow = rel[0].row;
    for (const auto& p : rel) {
        minRow = std::min(minRow, p.row);
    }
    return Tetromino{type, Rotation::R0, Position{topRow - minRow, (boardCols - 1) / 2}};
}

} // namespace stackfall::core
