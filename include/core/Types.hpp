#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <array> // For std::array

// Namespace for Stackfall core types
namespace stackfall::core {

// Position structure representing a cell in the grid (row 0 = top)
struct Position {
    int row{};
    int col{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Rotation states for Tetrominoes
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

enum class RotationDirection : std::uint8_t {
    Clockwise,
    CounterClockwise
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// 3 clockwise steps = 1 counter-clockwise
inline Rotation previousRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 3U) % 4U);
}

inline Rotation rotated(Rotation r, RotationDirection dir) {
    return dir == RotationDirection::Clockwise ? nextRotation(r) : previousRotation(r);
}

inline int rotationIndex(Rotation r) {
    return static_cast<int>(r);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, L, J, S, Z
};

constexpr int TetrominoTypeCount = 7;

constexpr std::array<TetrominoType, TetrominoTypeCount> AllTetrominoTypes{
    TetrominoType::I, TetrominoType::O, TetrominoType::T, TetrominoType::L,
    TetrominoType::J, TetrominoType::S, TetrominoType::Z
};

inline char tetrominoLabel(TetrominoType type) {
    switch (type) {
    case TetrominoType::I: return 'I';
    case TetrominoType::O: return 'O';
    case TetrominoType::T: return 'T';
    case TetrominoType::L: return 'L';
    case TetrominoType::J: return 'J';
    case TetrominoType::S: return 'S';
    case TetrominoType::Z: return 'Z';
    }
    return '?';
}

} // namespace stackfall::core
