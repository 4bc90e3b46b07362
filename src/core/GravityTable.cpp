#include "core/GravityTable.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace stackfall::core {

GravityTable::GravityTable(std::vector<int> framesPerCell)
    : framesPerCell_{std::move(framesPerCell)}
{
    if (framesPerCell_.empty()) {
        throw std::invalid_argument("Gravity table must have at least one level");
    }
    for (std::size_t i = 0; i < framesPerCell_.size(); ++i) {
        if (framesPerCell_[i] <= 0) {
            throw std::invalid_argument("Gravity table entry for level " + std::to_string(i + 1)
                                        + " must be positive");
        }
        if (i > 0 && framesPerCell_[i] > framesPerCell_[i - 1]) {
            throw std::invalid_argument("Gravity table level " + std::to_string(i + 1)
                                        + " is slower than level " + std::to_string(i));
        }
    }
}

int GravityTable::framesPerCell(int level) const {
    if (level < 1 || framesPerCell_.empty()) {
        throw std::out_of_range("GravityTable::framesPerCell level out of range");
    }
    const auto idx = std::min(static_cast<std::size_t>(level), framesPerCell_.size()) - 1;
    return framesPerCell_[idx];
}

int GravityTable::intervalMs(int level, int frameRateHz) const {
    if (frameRateHz <= 0) {
        throw std::invalid_argument("Frame rate must be positive");
    }
    return framesPerCell(level) * 1000 / frameRateHz;
}

} // namespace stackfall::core
