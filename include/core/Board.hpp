#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <vector>
#include <optional>

namespace stackfall::core {

enum class CellState : std::uint8_t {
    Empty,
    Filled
};

// Playfield grid. Rows [0, hiddenRows) form the buffer above the visible
// area; row 0 is the top. Dimensions are fixed at construction.
class Board {
public:
    Board(int visibleRows, int cols, int hiddenRows = 0);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }
    int visibleRows() const noexcept { return rows_ - hiddenRows_; }
    int hiddenRows() const noexcept { return hiddenRows_; }

    // Bounds-checked accessors; throw std::out_of_range outside the grid.
    CellState cell(int row, int col) const;
    bool isOccupied(int row, int col) const;

    // If the cell is filled, returns which tetromino type filled it.
    // Used by renderers for colored locked blocks.
    std::optional<TetrominoType> cellType(int row, int col) const;

    // Direct mutation for board setups; std::nullopt empties the cell.
    void setCell(int row, int col, std::optional<TetrominoType> type);

    // True for cells outside the grid or already filled.
    bool isCellBlocked(int row, int col) const noexcept;

    // Check if blocks can be placed (no collision with walls or filled cells)
    bool canPlace(const Tetromino::Shape& blocks) const noexcept;
    bool canPlace(const Tetromino& tetromino) const noexcept;

    // Mark the tetromino's blocks as Filled. The caller has just checked canPlace.
    void commit(const Tetromino& tetromino);

    // Remove every full row in one pass and collapse the rows above.
    // Returns the cleared row indices (pre-clear numbering, top to bottom).
    std::vector<int> clearFullRows();

    bool isRowFull(int row) const;

    // Number of rows from the bottom up to and including the highest filled
    // cell of the column; 0 for an empty column.
    int columnHeight(int col) const;

private:
    int rows_;
    int cols_;
    int hiddenRows_;
    std::vector<std::optional<TetrominoType>> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }

    bool rowFullUnchecked(int row) const noexcept;
};

} // namespace stackfall::core
