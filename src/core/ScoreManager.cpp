#include "core/ScoreManager.hpp"

#include <algorithm>

namespace stackfall::core {

ScoreManager::ScoreManager(ScoreTable table)
    : table_{table}
{
}

ClearAward ScoreManager::onPieceLocked(int rows, SpinType spin, int level) {
    ClearAward award{};
    if (rows < 0 || rows > 4) {
        // more than 4 lines at once can't happen with tetrominoes, ignore
        return award;
    }

    const auto idx = static_cast<std::size_t>(rows);
    std::uint64_t base = 0;
    switch (spin) {
    case SpinType::None: base = static_cast<std::uint64_t>(table_.lineClear[idx]); break;
    case SpinType::Mini: base = static_cast<std::uint64_t>(table_.miniSpin[idx]); break;
    case SpinType::Full: base = static_cast<std::uint64_t>(table_.fullSpin[idx]); break;
    }

    const auto l = static_cast<std::uint64_t>(std::max(level, 1));

    if (rows == 0) {
        // A lock without a clear breaks the combo but not the back-to-back chain.
        combo_ = 0;
        award.points = base * l;
        score_ += award.points;
        return award;
    }

    const bool difficult = rows == 4 || spin != SpinType::None;
    if (difficult) {
        if (backToBackActive_) {
            base = base * static_cast<std::uint64_t>(table_.backToBackNumerator)
                 / static_cast<std::uint64_t>(table_.backToBackDenominator);
            award.backToBack = true;
            ++backToBackCount_;
        }
        backToBackActive_ = true;
    } else {
        backToBackActive_ = false;
    }

    ++combo_;
    maxCombo_ = std::max(maxCombo_, combo_);
    if (combo_ > 1) {
        base += static_cast<std::uint64_t>(table_.comboBonus) * static_cast<std::uint64_t>(combo_);
    }

    award.combo = combo_;
    award.points = base * l;
    score_ += award.points;
    return award;
}

void ScoreManager::addSoftDrop(int cells) {
    if (cells <= 0) return;
    score_ += static_cast<std::uint64_t>(cells) * static_cast<std::uint64_t>(table_.softDropPerCell);
}

void ScoreManager::addHardDrop(int cells) {
    if (cells <= 0) return;
    score_ += static_cast<std::uint64_t>(cells) * static_cast<std::uint64_t>(table_.hardDropPerCell);
}

void ScoreManager::reset() noexcept {
    score_ = 0;
    combo_ = 0;
    maxCombo_ = 0;
    backToBackActive_ = false;
    backToBackCount_ = 0;
}

} // namespace stackfall::core
