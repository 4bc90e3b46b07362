#pragma once // Include guard

#include "Types.hpp" // For Position, Rotation, TetrominoType
#include <array> // For std::array

// Namespace for Stackfall core types
namespace stackfall::core {

// Represents a Tetromino piece: type, rotation state and pivot position.
// Value type; moving or rotating returns a new piece.
class Tetromino {
public:
    static constexpr int BlockCount = 4;

    using Shape = std::array<Position, BlockCount>;

    Tetromino(TetrominoType type, Rotation rotation, Position origin);

    TetrominoType type() const noexcept { return type_; }
    Rotation rotation() const noexcept { return rotation_; }
    Position origin() const noexcept { return origin_; }

    void setOrigin(Position p) noexcept { origin_ = p; }
    void setRotation(Rotation r) noexcept { rotation_ = r; }

    Tetromino shifted(int dRow, int dCol) const noexcept;

    // Positions of the 4 blocks in board coordinates
    Shape blocks() const noexcept;

    // Block offsets relative to the pivot for a given type + rotation (SRS layout).
    static const Shape& shapeFor(TetrominoType type, Rotation rotation) noexcept;

    // Where a freshly spawned piece of this type sits on a board of the given width.
    // The topmost block lands on topRow.
    static Tetromino spawn(TetrominoType type, int boardCols, int topRow) noexcept;

private:
    TetrominoType type_;
    Rotation rotation_;
    Position origin_; // pivot of the piece on the board
};

inline bool operator==(const Tetromino& a, const Tetromino& b) noexcept {
    return a.type() == b.type() && a.rotation() == b.rotation() && a.origin() == b.origin();
}

inline bool operator!=(const Tetromino& a, const Tetromino& b) noexcept {
    return !(a == b);
}

} // namespace stackfall::core
