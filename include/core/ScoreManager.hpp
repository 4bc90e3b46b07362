#pragma once

#include "RotationSystem.hpp"

#include <array>
#include <cstdint>

namespace stackfall::core {

// Tunable point values. Indexed by rows cleared in one lock (0..4).
// Every row of a table must be non-decreasing, and the spin rows must never
// pay less than the plain row for the same count.
struct ScoreTable {
    std::array<int, 5> lineClear{0, 100, 300, 500, 800};
    std::array<int, 5> miniSpin{100, 200, 400, 700, 1000};
    std::array<int, 5> fullSpin{400, 800, 1200, 1600, 2000};

    // Back-to-back difficult clears pay base * numerator / denominator.
    int backToBackNumerator{3};
    int backToBackDenominator{2};

    int comboBonus{50};      // per combo step, from the second consecutive clear
    int softDropPerCell{1};
    int hardDropPerCell{2};
};

struct ClearAward {
    std::uint64_t points{0};
    int combo{0};            // consecutive clearing locks, this one included
    bool backToBack{false};
};

class ScoreManager {
public:
    explicit ScoreManager(ScoreTable table = {});

    // Score one lock. rows outside 0..4 are ignored.
    ClearAward onPieceLocked(int rows, SpinType spin, int level);

    void addSoftDrop(int cells);
    void addHardDrop(int cells);

    std::uint64_t score() const noexcept { return score_; }
    int combo() const noexcept { return combo_; }
    int maxCombo() const noexcept { return maxCombo_; }
    int backToBackCount() const noexcept { return backToBackCount_; }

    void reset() noexcept;

private:
    ScoreTable table_;
    std::uint64_t score_{0};
    int combo_{0};
    int maxCombo_{0};
    bool backToBackActive_{false};
    int backToBackCount_{0};
};

} // namespace stackfall::core
