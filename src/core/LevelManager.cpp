#include "core/LevelManager.hpp"

#include <stdexcept>

namespace stackfall::core {

LevelManager::LevelManager(int startingLevel, int levelUpLines, int maxLevel)
    : startingLevel_{startingLevel}
    , levelUpLines_{levelUpLines}
    , maxLevel_{maxLevel}
    , level_{startingLevel}
{
    if (maxLevel < 1 || startingLevel < 1 || startingLevel > maxLevel) {
        throw std::invalid_argument("LevelManager: starting level must be within 1..maxLevel");
    }
    if (levelUpLines < 1) {
        throw std::invalid_argument("LevelManager: levelUpLines must be positive");
    }
}

bool LevelManager::onLinesCleared(int lines) {
    if (lines <= 0) return false;

    totalLinesCleared_ += static_cast<std::uint64_t>(lines);
    linesSinceLevelUp_ += lines;

    if (linesSinceLevelUp_ >= levelUpLines_ && level_ < maxLevel_) {
        ++level_;
        linesSinceLevelUp_ -= levelUpLines_;
        return true;
    }
    return false;
}

void LevelManager::reset() {
    level_ = startingLevel_;
    linesSinceLevelUp_ = 0;
    totalLinesCleared_ = 0;
}

} // namespace stackfall::core
