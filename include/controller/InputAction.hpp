#pragma once

namespace stackfall::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, scripted tests, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SlideLeft,   // move left until blocked (ARR = 0)
    SlideRight,  // move right until blocked (ARR = 0)
    SoftDrop,
    HardDrop,
    RotateCW,
    RotateCCW,
    Hold,
    PauseResume
};

// Held state of every logical button for one frame.
struct InputSnapshot {
    bool moveLeft{false};
    bool moveRight{false};
    bool softDrop{false};
    bool hardDrop{false};
    bool rotateCW{false};
    bool rotateCCW{false};
    bool hold{false};
    bool pause{false};
};

} // namespace stackfall::controller
