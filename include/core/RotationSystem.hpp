#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "Types.hpp"

#include <array>
#include <optional>

namespace stackfall::core {

// One wall-kick candidate. Written the way published SRS tables are:
// x grows to the right, y grows upwards.
struct KickOffset {
    int x{};
    int y{};
};

constexpr int KicksPerTransition = 5;
using KickList = std::array<KickOffset, KicksPerTransition>;

// Ordered kick candidates for a rotation from -> to. Transitions that are not
// a single quarter turn yield the zero list.
const KickList& kicksFor(TetrominoType type, Rotation from, Rotation to) noexcept;

// Successful rotation: the rotated piece and which kick candidate placed it.
struct RotationResult {
    Tetromino piece;
    int kickIndex{0};
};

// Try the target rotation against each kick in order. std::nullopt when every
// candidate collides; the input piece is never modified.
std::optional<RotationResult> attemptRotate(const Board& board,
                                            const Tetromino& piece,
                                            RotationDirection direction);

enum class SpinType : std::uint8_t {
    None,
    Mini,
    Full
};

// What the piece's last successful action was, as far as spin rules care.
struct LastAction {
    bool wasRotation{false};
    int kickIndex{0};
};

// Classify a piece about to lock.
// - T with >= 3 blocked diagonal corners after a rotation: Full when both
//   corners on the pointing side are blocked or the last kick was needed,
//   Mini otherwise.
// - Any piece rotated in through a non-zero kick that cannot fall further: Mini.
SpinType detectSpin(const Board& board, const Tetromino& piece, const LastAction& last);

} // namespace stackfall::core
