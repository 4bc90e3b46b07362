#pragma once

#include <cstdint>

namespace stackfall::core {

class LevelManager {
public:
    // Levels are 1-based; levelUpLines >= 1, 1 <= startingLevel <= maxLevel.
    LevelManager(int startingLevel, int levelUpLines, int maxLevel);

    int level() const noexcept { return level_; }
    int maxLevel() const noexcept { return maxLevel_; }
    int levelUpLines() const noexcept { return levelUpLines_; }
    int linesSinceLevelUp() const noexcept { return linesSinceLevelUp_; }
    std::uint64_t totalLinesCleared() const noexcept { return totalLinesCleared_; }

    // Call after lines are cleared; returns true when the level went up.
    // Overflow lines carry over into the next level.
    bool onLinesCleared(int lines);

    void reset();

private:
    int startingLevel_;
    int levelUpLines_;
    int maxLevel_;

    int level_;
    int linesSinceLevelUp_{0};
    std::uint64_t totalLinesCleared_{0};
};

} // namespace stackfall::core
