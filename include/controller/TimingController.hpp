#pragma once

#include "controller/InputAction.hpp"

#include <chrono>
#include <vector>

namespace stackfall::controller {

struct TimingSettings {
    int dasDelayMs{170};
    int arrDelayMs{30};
    int softDropIntervalMs{50};
};

// Turns per-frame held-button snapshots into de-bounced actions.
// Knows nothing about the board; identical (input, elapsed) sequences always
// produce identical actions.
//
// Per frame the actions come out in priority order:
// PauseResume, Hold, RotateCW, RotateCCW, horizontal moves, SoftDrop, HardDrop.
class TimingController {
public:
    using Duration = std::chrono::milliseconds;

    explicit TimingController(TimingSettings settings);

    std::vector<InputAction> update(const InputSnapshot& input, Duration elapsed);

    // Samples only the pause button. True on its press edge, which update()
    // then no longer reports. Every other button and timer is left untouched,
    // so a caller can pause before this frame's time reaches DAS/ARR.
    bool pollPause(const InputSnapshot& input);

    // True while the soft-drop button is held; gravity defers to the soft-drop schedule.
    bool softDropHeld() const noexcept { return softDrop_.held; }

    // Time the given direction has been charging (0 when not the active direction).
    Duration dasCharge(InputAction direction) const noexcept;

    void reset();

private:
    struct DirectionTimer {
        bool held{false};
        Duration charge{0};    // time since press (DAS)
        Duration repeatAcc{0}; // time since last repeat (ARR)
    };

    struct RepeatTimer {
        bool held{false};
        Duration acc{0};
    };

    enum class Direction { None, Left, Right };

    void updateHorizontal(const InputSnapshot& input, Duration elapsed,
                          std::vector<InputAction>& out);
    void autoRepeat(DirectionTimer& timer, Duration elapsed, InputAction move,
                    InputAction slide, std::vector<InputAction>& out);
    void updateSoftDrop(bool held, Duration elapsed, std::vector<InputAction>& out);

    TimingSettings settings_;

    DirectionTimer left_;
    DirectionTimer right_;
    Direction active_{Direction::None};
    RepeatTimer softDrop_;

    // Previous-frame state of the edge-triggered buttons
    bool prevHardDrop_{false};
    bool prevRotateCW_{false};
    bool prevRotateCCW_{false};
    bool prevHold_{false};
    bool prevPause_{false};
};

} // namespace stackfall::controller
