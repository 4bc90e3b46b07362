#include "core/GameConfig.hpp"

namespace stackfall::core {

namespace {

void require(bool ok, const std::string& field, const std::string& rule) {
    if (!ok) {
        throw ConfigError("Invalid configuration: " + field + " " + rule);
    }
}

void requireNonDecreasing(const std::array<int, 5>& row, const std::string& field) {
    for (std::size_t i = 0; i < row.size(); ++i) {
        require(row[i] >= 0, field, "must not contain negative points");
        if (i > 0) {
            require(row[i] >= row[i - 1], field, "must not pay less for more rows");
        }
    }
}

} // namespace

void GameConfig::validate() const {
    require(visibleRows >= 4, "visibleRows", "must be at least 4");
    require(cols >= 4, "cols", "must be at least 4");
    require(hiddenRows >= 0, "hiddenRows", "must not be negative");

    require(frameRateHz > 0, "frameRateHz", "must be positive");
    require(dasDelayMs >= 0, "dasDelayMs", "must not be negative");
    require(arrDelayMs >= 0, "arrDelayMs", "must not be negative");
    require(softDropIntervalMs > 0, "softDropIntervalMs", "must be positive");
    require(lockDelayMs >= 0, "lockDelayMs", "must not be negative");
    require(maxLockResets >= 0, "maxLockResets", "must not be negative");
    require(lineClearDelayMs >= 0, "lineClearDelayMs", "must not be negative");

    require(maxLevel >= 1, "maxLevel", "must be at least 1");
    require(startLevel >= 1 && startLevel <= maxLevel, "startLevel", "must be within 1..maxLevel");
    require(levelUpLines >= 1, "levelUpLines", "must be positive");
    require(static_cast<int>(gravityTable.size()) >= maxLevel,
            "gravityTable", "is missing entries for some levels up to maxLevel");
    for (std::size_t i = 0; i < gravityTable.size(); ++i) {
        const std::string field = "gravityTable[level " + std::to_string(i + 1) + "]";
        require(gravityTable[i] > 0, field, "must be positive");
        if (i > 0) {
            require(gravityTable[i] <= gravityTable[i - 1], field, "must not be slower than the level below");
        }
    }
    if (mode == GameMode::Victory) {
        require(victoryLevel > startLevel && victoryLevel <= maxLevel,
                "victoryLevel", "must be above startLevel and at most maxLevel");
    }

    require(previewCount >= 0 && previewCount <= 6, "previewCount", "must be within 0..6");

    requireNonDecreasing(scoreTable.lineClear, "scoreTable.lineClear");
    requireNonDecreasing(scoreTable.miniSpin, "scoreTable.miniSpin");
    requireNonDecreasing(scoreTable.fullSpin, "scoreTable.fullSpin");
    for (std::size_t i = 0; i < scoreTable.lineClear.size(); ++i) {
        require(scoreTable.miniSpin[i] >= scoreTable.lineClear[i], "scoreTable.miniSpin",
                "must not pay less than a plain clear");
        require(scoreTable.fullSpin[i] >= scoreTable.miniSpin[i], "scoreTable.fullSpin",
                "must not pay less than a mini spin");
    }
    require(scoreTable.backToBackDenominator > 0
            && scoreTable.backToBackNumerator >= scoreTable.backToBackDenominator,
            "scoreTable.backToBack", "multiplier must be at least 1");
    require(scoreTable.comboBonus >= 0, "scoreTable.comboBonus", "must not be negative");
    require(scoreTable.softDropPerCell >= 0, "scoreTable.softDropPerCell", "must not be negative");
    require(scoreTable.hardDropPerCell >= 0, "scoreTable.hardDropPerCell", "must not be negative");
}

} // namespace stackfall::core
