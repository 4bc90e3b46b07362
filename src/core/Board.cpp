#include "core/Board.hpp"
#include <stdexcept>

namespace stackfall::core {

Board::Board(int visibleRows, int cols, int hiddenRows)
    : rows_{visibleRows + hiddenRows}
    , cols_{cols}
    , hiddenRows_{hiddenRows}
{
    if (visibleRows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    if (hiddenRows < 0) {
        throw std::invalid_argument("Board hidden rows must not be negative");
    }
    grid_.assign(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), std::nullopt);
}

CellState Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)] ? CellState::Filled : CellState::Empty;
}

bool Board::isOccupied(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::isOccupied out of range");
    }
    return grid_[index(row, col)].has_value();
}

std::optional<TetrominoType> Board::cellType(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cellType out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, std::optional<TetrominoType> type) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    grid_[index(row, col)] = type;
}

bool Board::isCellBlocked(int row, int col) const noexcept {
    return !isInside(row, col) || grid_[index(row, col)].has_value();
}

bool Board::canPlace(const Tetromino::Shape& blocks) const noexcept {
    for (const auto& b : blocks) {
        if (!isInside(b.row, b.col)) {
            return false; // out of board
        }
        if (grid_[index(b.row, b.col)]) {
            return false; // collision
        }
    }
    return true;
}

bool Board::canPlace(const Tetromino& tetromino) const noexcept {
    return canPlace(tetromino.blocks());
}

void Board::commit(const Tetromino& tetromino) {
    for (const auto& b : tetromino.blocks()) {
        grid_[index(b.row, b.col)] = tetromino.type();
    }
}

bool Board::rowFullUnchecked(int row) const noexcept {
    for (int col = 0; col < cols_; ++col) {
        if (!grid_[index(row, col)]) {
            return false;
        }
    }
    return true;
}

std::vector<int> Board::clearFullRows() {
    std::vector<int> cleared;
    for (int row = 0; row < rows_; ++row) {
        if (rowFullUnchecked(row)) {
            cleared.push_back(row);
        }
    }
    if (cleared.empty()) {
        return cleared;
    }

    // Compact bottom-up: every kept row moves down by the number of
    // cleared rows below it.
    int write = rows_ - 1;
    auto next = cleared.rbegin();
    for (int read = rows_ - 1; read >= 0; --read) {
        if (next != cleared.rend() && *next == read) {
            ++next;
            continue;
        }
        if (write != read) {
            for (int c = 0; c < cols_; ++c) {
                grid_[index(write, c)] = grid_[index(read, c)];
            }
        }
        --write;
    }

    // Newly exposed rows at the top
    for (int r = write; r >= 0; --r) {
        for (int c = 0; c < cols_; ++c) {
            grid_[index(r, c)] = std::nullopt;
        }
    }

    return cleared;
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    return rowFullUnchecked(row);
}

int Board::columnHeight(int col) const {
    if (col < 0 || col >= cols_) {
        throw std::out_of_range("Board::columnHeight out of range");
    }
    for (int row = 0; row < rows_; ++row) {
        if (grid_[index(row, col)]) {
            return rows_ - row;
        }
    }
    return 0;
}

} // namespace stackfall::core
