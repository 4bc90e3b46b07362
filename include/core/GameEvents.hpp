#pragma once

#include "RotationSystem.hpp"
#include "Types.hpp"

#include <cstdint>
#include <variant>

namespace stackfall::core {

// Notifications queued by the session during a frame. Collaborators
// (audio, persistence, UI) pull them with GameSession::drainEvents().

struct LinesClearedEvent {
    int rows{0};
    bool wasSpin{false};
    bool wasTetris{false};
    SpinType spin{SpinType::None};
    int combo{0};
    bool backToBack{false};
    std::uint64_t points{0};
};

struct LevelUpEvent {
    int level{0};
};

struct PieceLockedEvent {
    TetrominoType type{TetrominoType::I};
    SpinType spin{SpinType::None};
};

struct HoldUsedEvent {
    TetrominoType stored{TetrominoType::I}; // type that went into the hold slot
};

struct GameEndedEvent {
    bool victory{false};
};

struct PausedEvent {};
struct ResumedEvent {};

using GameEvent = std::variant<
    LinesClearedEvent,
    LevelUpEvent,
    PieceLockedEvent,
    HoldUsedEvent,
    GameEndedEvent,
    PausedEvent,
    ResumedEvent
>;

} // namespace stackfall::core
