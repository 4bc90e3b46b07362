#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "BagSource.hpp"
#include "PieceQueue.hpp"
#include "GravityTable.hpp"
#include "ScoreManager.hpp"
#include "LevelManager.hpp"
#include "RotationSystem.hpp"
#include "GameConfig.hpp"
#include "GameEvents.hpp"
#include "controller/InputAction.hpp"
#include "controller/TimingController.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace stackfall::core {

// Per-state data of the session state machine.
namespace phase {

struct NotStarted {};
struct Spawning {};
struct Falling {};
struct Locking {
    int elapsedMs{0};
};
struct Clearing {
    int rows{0};
    int remainingMs{0};
};

// Phases that pause can interrupt and resume restores.
using Active = std::variant<Falling, Locking, Clearing>;

struct Paused {
    Active interrupted;
};
struct GameOver {
    bool victory{false};
};

} // namespace phase

using PhaseState = std::variant<
    phase::NotStarted,
    phase::Spawning,
    phase::Falling,
    phase::Locking,
    phase::Clearing,
    phase::Paused,
    phase::GameOver
>;

// Same order as the PhaseState alternatives.
enum class GamePhase {
    NotStarted,
    Spawning,
    Falling,
    Locking,
    Clearing,
    Paused,
    GameOver
};

// Read-only picture of one frame for renderers.
struct SessionSnapshot {
    int rows{0};
    int cols{0};
    int hiddenRows{0};
    std::vector<std::optional<TetrominoType>> cells; // row-major, rows * cols

    std::optional<Tetromino> active;
    std::optional<Tetromino> ghost;
    std::optional<TetrominoType> hold;
    bool holdAvailable{false};
    std::vector<TetrominoType> preview;

    std::uint64_t score{0};
    int level{1};
    std::uint64_t linesCleared{0};
    GamePhase phase{GamePhase::NotStarted};

    const std::optional<TetrominoType>& at(int row, int col) const {
        return cells[static_cast<std::size_t>(row * cols + col)];
    }
};

// End-of-session statistics for persistence collaborators.
struct SessionSummary {
    std::uint64_t score{0};
    int level{1};
    std::uint64_t lines{0};
    int piecesLocked{0};
    int tetrises{0};
    int spins{0};
    int maxCombo{0};
    int backToBacks{0};
    int softDropCells{0};
    int hardDropCells{0};
    std::int64_t playTimeMs{0};
    bool victory{false};
    bool finished{false};
};

class GameSession {
public:
    using Duration = std::chrono::milliseconds;

    // Both constructors validate the configuration and throw ConfigError.
    explicit GameSession(const GameConfig& config);
    GameSession(const GameConfig& config, std::unique_ptr<IBagSource> bagSource);

    // Control API
    void start();
    // Start on a prepared stack (practice and puzzle setups). The board must
    // have the configured dimensions; throws std::invalid_argument otherwise.
    void start(const Board& initial);
    void reset();

    // One frame: feed the held buttons and the time since the previous frame.
    void update(const controller::InputSnapshot& input, Duration elapsed);

    void pause();
    void resume();
    void togglePause();

    // Direct player actions. No-ops unless a piece is Falling or Locking;
    // blocked moves leave everything unchanged.
    void moveLeft();
    void moveRight();
    void slideLeft();
    void slideRight();
    void rotateClockwise();
    void rotateCounterClockwise();
    void softDrop();
    void hardDrop();
    void hold();

    // Queries
    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return board_; }
    std::optional<Tetromino> activePiece() const;
    std::optional<Tetromino> ghostPiece() const;
    const std::optional<TetrominoType>& holdPiece() const noexcept { return hold_; }
    bool canHold() const noexcept;
    std::vector<TetrominoType> preview() const;

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    int level() const noexcept { return levelManager_.level(); }
    std::uint64_t linesCleared() const noexcept { return levelManager_.totalLinesCleared(); }
    int linesSinceLevelUp() const noexcept { return levelManager_.linesSinceLevelUp(); }
    int lockedPieces() const noexcept { return piecesLocked_; }
    int gravityIntervalMs() const;

    GamePhase phase() const noexcept;
    const PhaseState& phaseState() const noexcept { return phase_; }
    bool isGameOver() const noexcept { return std::holds_alternative<phase::GameOver>(phase_); }

    const controller::TimingController& timing() const noexcept { return timing_; }

    SessionSnapshot snapshot() const;
    SessionSummary summary() const;

    // Events queued since the last call, oldest first.
    std::vector<GameEvent> drainEvents();

private:
    struct ActivePiece {
        Tetromino piece;
        int lowestRow{0};     // deepest bottom row reached; a new low restores the resets
        int lockResets{0};
        int lockElapsedMs{0}; // lock timer kept while the piece is lifted off the ground
        LastAction lastAction{};
    };

    const GameConfig config_;
    GravityTable gravity_;
    Board board_;
    PieceQueue queue_;
    controller::TimingController timing_;
    ScoreManager scoreManager_;
    LevelManager levelManager_;

    std::optional<ActivePiece> active_;
    std::optional<TetrominoType> hold_;
    bool holdUsed_{false};

    PhaseState phase_{phase::NotStarted{}};
    std::int64_t gravityAccum_{0}; // ms * Hz, one cell per framesPerCell * 1000
    std::uint64_t spawnCount_{0};

    int piecesLocked_{0};
    int tetrises_{0};
    int spins_{0};
    int softDropCells_{0};
    int hardDropCells_{0};
    std::int64_t playTimeMs_{0};

    std::vector<GameEvent> events_;

    bool canStart() const noexcept;
    void clearState();
    bool pieceInPlay() const noexcept;

    void applyAction(controller::InputAction action);
    void advanceTimers(Duration elapsed);
    void applyGravity(Duration elapsed);

    bool tryShift(int dRow, int dCol);
    void tryRotate(RotationDirection direction);
    void slide(int dCol);
    void onPieceAdjusted();
    void refreshGrounding();
    bool isGrounded() const;

    void lockPiece();
    void spawnNext();
    bool placePiece(TetrominoType type);
    void endGame(bool victory);
};

} // namespace stackfall::core
