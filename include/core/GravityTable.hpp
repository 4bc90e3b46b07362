#pragma once

#include <vector>

namespace stackfall::core {

// Fall speed per level, in frames per cell. Level numbering starts at 1.
class GravityTable {
public:
    GravityTable() = default;

    // framesPerCell[0] is level 1. Throws std::invalid_argument when empty,
    // non-positive, or faster levels are followed by slower ones.
    explicit GravityTable(std::vector<int> framesPerCell);

    int maxLevel() const noexcept { return static_cast<int>(framesPerCell_.size()); }

    // Levels above the table reuse its last entry; throws std::out_of_range below 1.
    int framesPerCell(int level) const;

    // Milliseconds per cell at the given frame rate.
    int intervalMs(int level, int frameRateHz) const;

private:
    std::vector<int> framesPerCell_;
};

} // namespace stackfall::core
