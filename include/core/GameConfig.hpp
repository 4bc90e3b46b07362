#pragma once

#include "ScoreManager.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace stackfall::core {

// Thrown when a configuration value is missing or out of range.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class GameMode {
    Endless, // play until top-out
    Victory  // the session ends in a win when victoryLevel is reached
};

// Session parameters. Built once by the caller, validated by the session,
// and never modified while a session runs.
struct GameConfig {
    // Board
    int visibleRows{20};
    int cols{10};
    int hiddenRows{2};

    // Timing
    int frameRateHz{60};
    int dasDelayMs{170};
    int arrDelayMs{30};            // 0 = pieces slide to the wall instantly
    int softDropIntervalMs{50};
    int lockDelayMs{500};
    int maxLockResets{15};
    int lineClearDelayMs{200};     // 0 = no clear animation pause

    // Frames per cell for level 1, 2, ...; one entry per level up to maxLevel.
    std::vector<int> gravityTable{60, 50, 40, 30, 25, 20, 15, 12, 10, 8,
                                  7, 6, 5, 4, 3, 3, 2, 2, 1, 1};

    // Progression
    int startLevel{1};
    int levelUpLines{10};
    int maxLevel{20};
    GameMode mode{GameMode::Endless};
    int victoryLevel{20};

    // Features
    bool ghostEnabled{true};
    bool holdEnabled{true};
    int previewCount{3};
    bool spinBonusEnabled{true};

    std::uint32_t seed{0};
    ScoreTable scoreTable{};

    // Throws ConfigError naming the first invalid field.
    void validate() const;
};

} // namespace stackfall::core
