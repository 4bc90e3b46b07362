#include "core/PieceQueue.hpp"

#include <algorithm>
#include <stdexcept>

namespace stackfall::core {

PieceQueue::PieceQueue(std::unique_ptr<IBagSource> source, int previewCount)
    : source_{std::move(source)}
    , previewCount_{previewCount}
{
    if (!source_) {
        throw std::invalid_argument("PieceQueue requires a bag source");
    }
    if (previewCount_ < 0) {
        throw std::invalid_argument("PieceQueue preview count must not be negative");
    }
    refill();
}

TetrominoType PieceQueue::next() {
    const TetrominoType type = queue_.front();
    queue_.pop_front();
    refill();
    return type;
}

std::vector<TetrominoType> PieceQueue::peek(int n) const {
    const auto count = static_cast<std::size_t>(std::clamp(n, 0, previewCount_ + 1));
    return std::vector<TetrominoType>(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(count));
}

void PieceQueue::refill() {
    const auto minSize = static_cast<std::size_t>(previewCount_) + 1U;
    while (queue_.size() < minSize) {
        auto bag = source_->nextBag();
        if (bag.empty()) {
            throw std::logic_error("IBagSource returned an empty bag");
        }
        queue_.insert(queue_.end(), bag.begin(), bag.end());
    }
}

} // namespace stackfall::core
