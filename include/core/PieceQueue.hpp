#pragma once

#include "BagSource.hpp"
#include "Types.hpp"

#include <deque>
#include <memory>
#include <vector>

namespace stackfall::core {

// Upcoming piece types. Always holds at least previewCount + 1 entries,
// refilled one whole bag at a time so bag boundaries are never interleaved.
class PieceQueue {
public:
    PieceQueue(std::unique_ptr<IBagSource> source, int previewCount);

    // Pop the front type.
    TetrominoType next();

    // Next n types without consuming them (n is clamped to the preview window).
    std::vector<TetrominoType> peek(int n) const;

    int previewCount() const noexcept { return previewCount_; }
    std::size_t size() const noexcept { return queue_.size(); }

private:
    void refill();

    std::unique_ptr<IBagSource> source_;
    int previewCount_;
    std::deque<TetrominoType> queue_;
};

} // namespace stackfall::core
