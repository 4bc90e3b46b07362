#include "core/RotationSystem.hpp"

namespace stackfall::core {

namespace {

using K = KickList;
using TransitionTable = std::array<std::array<KickList, 4>, 4>; // [from][to]

constexpr K kNone{{ {0, 0}, {0, 0}, {0, 0}, {0, 0}, {0, 0} }};

// J, L, S, T, Z
constexpr TransitionTable kJlstzKicks{{
    // from R0
    {{
        kNone,
        K{{ {0, 0}, {-1, 0}, {-1, +1}, {0, -2}, {-1, -2} }}, // 0 -> R
        kNone,
        K{{ {0, 0}, {+1, 0}, {+1, +1}, {0, -2}, {+1, -2} }}, // 0 -> L
    }},
    // from R90
    {{
        K{{ {0, 0}, {+1, 0}, {+1, -1}, {0, +2}, {+1, +2} }}, // R -> 0
        kNone,
        K{{ {0, 0}, {+1, 0}, {+1, -1}, {0, +2}, {+1, +2} }}, // R -> 2
        kNone,
    }},
    // from R180
    {{
        kNone,
        K{{ {0, 0}, {-1, 0}, {-1, +1}, {0, -2}, {-1, -2} }}, // 2 -> R
        kNone,
        K{{ {0, 0}, {+1, 0}, {+1, +1}, {0, -2}, {+1, -2} }}, // 2 -> L
    }},
    // from R270
    {{
        K{{ {0, 0}, {-1, 0}, {-1, -1}, {0, +2}, {-1, +2} }}, // L -> 0
        kNone,
        K{{ {0, 0}, {-1, 0}, {-1, -1}, {0, +2}, {-1, +2} }}, // L -> 2
        kNone,
    }},
}};

constexpr TransitionTable kIKicks{{
    // from R0
    {{
        kNone,
        K{{ {0, 0}, {-2, 0}, {+1, 0}, {-2, -1}, {+1, +2} }}, // 0 -> R
        kNone,
        K{{ {0, 0}, {-1, 0}, {+2, 0}, {-1, +2}, {+2, -1} }}, // 0 -> L
    }},
    // from R90
    {{
        K{{ {0, 0}, {+2, 0}, {-1, 0}, {+2, +1}, {-1, -2} }}, // R -> 0
        kNone,
        K{{ {0, 0}, {-1, 0}, {+2, 0}, {-1, +2}, {+2, -1} }}, // R -> 2
        kNone,
    }},
    // from R180
    {{
        kNone,
        K{{ {0, 0}, {+1, 0}, {-2, 0}, {+1, -2}, {-2, +1} }}, // 2 -> R
        kNone,
        K{{ {0, 0}, {+2, 0}, {-1, 0}, {+2, +1}, {-1, -2} }}, // 2 -> L
    }},
    // from R270
    {{
        K{{ {0, 0}, {+1, 0}, {-2, 0}, {+1, -2}, {-2, +1} }}, // L -> 0
        kNone,
        K{{ {0, 0}, {-2, 0}, {+1, 0}, {-2, -1}, {+1, +2} }}, // L -> 2
        kNone,
    }},
}};

// Diagonal neighbours of the T center: top-left, top-right, bottom-left, bottom-right.
constexpr std::array<Position, 4> kTCorners{{ {-1, -1}, {-1, 1}, {1, -1}, {1, 1} }};

// Indices into kTCorners of the two corners on the side the T points to.
constexpr std::array<std::array<int, 2>, 4> kTFrontCorners{{
    {{0, 1}}, // R0 points up
    {{1, 3}}, // R90 points right
    {{2, 3}}, // R180 points down
    {{0, 2}}, // R270 points left
}};

} // namespace

const KickList& kicksFor(TetrominoType type, Rotation from, Rotation to) noexcept {
    const auto f = static_cast<std::size_t>(from);
    const auto t = static_cast<std::size_t>(to);
    switch (type) {
    case TetrominoType::O:
        return kNone;
    case TetrominoType::I:
        return kIKicks[f][t];
    default:
        return kJlstzKicks[f][t];
    }
}

std::optional<RotationResult> attemptRotate(const Board& board,
                                            const Tetromino& piece,
                                            RotationDirection direction)
{
    const Rotation target = rotated(piece.rotation(), direction);
    const KickList& kicks = kicksFor(piece.type(), piece.rotation(), target);

    Tetromino candidate = piece;
    candidate.setRotation(target);

    for (int i = 0; i < KicksPerTransition; ++i) {
        // Kick y points up, board rows grow downwards.
        const Tetromino moved = candidate.shifted(-kicks[i].y, kicks[i].x);
        if (board.canPlace(moved)) {
            return RotationResult{moved, i};
        }
    }
    return std::nullopt;
}

SpinType detectSpin(const Board& board, const Tetromino& piece, const LastAction& last) {
    if (!last.wasRotation) {
        return SpinType::None;
    }

    if (piece.type() == TetrominoType::T) {
        const Position c = piece.origin();
        std::array<bool, 4> blocked{};
        int blockedCount = 0;
        for (std::size_t i = 0; i < kTCorners.size(); ++i) {
            blocked[i] = board.isCellBlocked(c.row + kTCorners[i].row, c.col + kTCorners[i].col);
            if (blocked[i]) ++blockedCount;
        }

        if (blockedCount >= 3) {
            const auto& front = kTFrontCorners[static_cast<std::size_t>(piece.rotation())];
            const bool frontBlocked = blocked[front[0]] && blocked[front[1]];
            if (frontBlocked || last.kickIndex == KicksPerTransition - 1) {
                return SpinType::Full;
            }
            return SpinType::Mini;
        }
    }

    const bool grounded = !board.canPlace(piece.shifted(1, 0));
    if (last.kickIndex > 0 && grounded) {
        return SpinType::Mini;
    }
    return SpinType::None;
}

} // namespace stackfall::core
