#include "core/GameSession.hpp"

#include <algorithm>
#include <stdexcept>

namespace stackfall::core {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

controller::TimingSettings timingSettings(const GameConfig& config) {
    return controller::TimingSettings{config.dasDelayMs, config.arrDelayMs, config.softDropIntervalMs};
}

int bottomRow(const Tetromino& piece) {
    int bottom = piece.origin().row;
    for (const auto& b : piece.blocks()) {
        bottom = std::max(bottom, b.row);
    }
    return bottom;
}

} // namespace

GameSession::GameSession(const GameConfig& config)
    : GameSession(config, std::make_unique<SevenBagSource>(config.seed))
{
}

GameSession::GameSession(const GameConfig& config, std::unique_ptr<IBagSource> bagSource)
    : config_{validated(config)}
    , gravity_{config_.gravityTable}
    , board_{config_.visibleRows, config_.cols, config_.hiddenRows}
    , queue_{std::move(bagSource), config_.previewCount}
    , timing_{timingSettings(config_)}
    , scoreManager_{config_.scoreTable}
    , levelManager_{config_.startLevel, config_.levelUpLines, config_.maxLevel}
{
}

bool GameSession::canStart() const noexcept {
    return std::holds_alternative<phase::NotStarted>(phase_) || isGameOver();
}

void GameSession::start() {
    if (!canStart()) {
        return; // already running or paused
    }
    clearState();
    spawnNext();
}

void GameSession::start(const Board& initial) {
    if (initial.visibleRows() != config_.visibleRows || initial.cols() != config_.cols
        || initial.hiddenRows() != config_.hiddenRows) {
        throw std::invalid_argument("Initial board does not match the configured dimensions");
    }
    if (!canStart()) {
        return;
    }
    clearState();
    board_ = initial;
    spawnNext();
}

void GameSession::reset() {
    clearState();
}

void GameSession::clearState() {
    board_ = Board{config_.visibleRows, config_.cols, config_.hiddenRows};
    timing_.reset();
    scoreManager_.reset();
    levelManager_.reset();

    active_.reset();
    hold_.reset();
    holdUsed_ = false;

    phase_ = phase::NotStarted{};
    gravityAccum_ = 0;
    spawnCount_ = 0;

    piecesLocked_ = 0;
    tetrises_ = 0;
    spins_ = 0;
    softDropCells_ = 0;
    hardDropCells_ = 0;
    playTimeMs_ = 0;

    events_.clear();
}

void GameSession::update(const controller::InputSnapshot& input, Duration elapsed) {
    using controller::InputAction;

    if (std::holds_alternative<phase::NotStarted>(phase_) || isGameOver()) {
        return;
    }

    // The pause button is read before any timer sees this frame, so the
    // pausing frame and the paused ones add nothing to DAS, gravity or locking.
    // Other buttons are not sampled while paused and keep their press edges.
    if (std::holds_alternative<phase::Paused>(phase_)) {
        if (timing_.pollPause(input)) {
            resume();
        }
        return;
    }
    if (timing_.pollPause(input)) {
        pause();
        return;
    }

    const std::size_t phaseAtStart = phase_.index();
    const std::uint64_t spawnsAtStart = spawnCount_;

    for (InputAction action : timing_.update(input, elapsed)) {
        applyAction(action);
        if (isGameOver()) {
            return;
        }
    }

    playTimeMs_ += elapsed.count();

    // Time belongs to the phase the frame started in. A piece that locked,
    // a clear that just began or a fresh spawn starts counting next frame.
    if (phase_.index() == phaseAtStart && spawnCount_ == spawnsAtStart) {
        advanceTimers(elapsed);
    }
}

void GameSession::applyAction(controller::InputAction action) {
    using controller::InputAction;

    switch (action) {
    case InputAction::MoveLeft:
        moveLeft();
        break;
    case InputAction::MoveRight:
        moveRight();
        break;
    case InputAction::SlideLeft:
        slideLeft();
        break;
    case InputAction::SlideRight:
        slideRight();
        break;
    case InputAction::SoftDrop:
        softDrop();
        break;
    case InputAction::HardDrop:
        hardDrop();
        break;
    case InputAction::RotateCW:
        rotateClockwise();
        break;
    case InputAction::RotateCCW:
        rotateCounterClockwise();
        break;
    case InputAction::Hold:
        hold();
        break;
    case InputAction::PauseResume:
        togglePause();
        break;
    }
}

void GameSession::advanceTimers(Duration elapsed) {
    const int ms = static_cast<int>(elapsed.count());

    if (auto* clearing = std::get_if<phase::Clearing>(&phase_)) {
        clearing->remainingMs -= ms;
        if (clearing->remainingMs <= 0) {
            spawnNext();
        }
    } else if (std::holds_alternative<phase::Falling>(phase_)) {
        if (timing_.softDropHeld()) {
            // Soft drop runs on its own schedule while held
            gravityAccum_ = 0;
        } else {
            applyGravity(elapsed);
        }
    } else if (auto* locking = std::get_if<phase::Locking>(&phase_)) {
        locking->elapsedMs += ms;
        if (locking->elapsedMs >= config_.lockDelayMs) {
            lockPiece();
        }
    }
}

void GameSession::applyGravity(Duration elapsed) {
    gravityAccum_ += static_cast<std::int64_t>(elapsed.count()) * config_.frameRateHz;
    const std::int64_t threshold = static_cast<std::int64_t>(gravity_.framesPerCell(level())) * 1000;

    while (gravityAccum_ >= threshold && std::holds_alternative<phase::Falling>(phase_)) {
        gravityAccum_ -= threshold;
        tryShift(1, 0);
        refreshGrounding();
    }

    if (!std::holds_alternative<phase::Falling>(phase_)) {
        gravityAccum_ = 0;
    }
}

void GameSession::pause() {
    std::optional<phase::Active> current;
    if (const auto* falling = std::get_if<phase::Falling>(&phase_)) {
        current = *falling;
    } else if (const auto* locking = std::get_if<phase::Locking>(&phase_)) {
        current = *locking;
    } else if (const auto* clearing = std::get_if<phase::Clearing>(&phase_)) {
        current = *clearing;
    }
    if (!current) {
        return;
    }

    phase_ = phase::Paused{*current};
    events_.push_back(PausedEvent{});
}

void GameSession::resume() {
    const auto* paused = std::get_if<phase::Paused>(&phase_);
    if (!paused) {
        return;
    }

    const phase::Active interrupted = paused->interrupted;
    phase_ = std::visit([](const auto& state) -> PhaseState { return state; }, interrupted);
    events_.push_back(ResumedEvent{});
}

void GameSession::togglePause() {
    if (std::holds_alternative<phase::Paused>(phase_)) {
        resume();
    } else {
        pause();
    }
}

bool GameSession::pieceInPlay() const noexcept {
    return active_.has_value()
        && (std::holds_alternative<phase::Falling>(phase_) || std::holds_alternative<phase::Locking>(phase_));
}

void GameSession::moveLeft() {
    if (!pieceInPlay()) return;
    if (tryShift(0, -1)) {
        onPieceAdjusted();
    }
}

void GameSession::moveRight() {
    if (!pieceInPlay()) return;
    if (tryShift(0, 1)) {
        onPieceAdjusted();
    }
}

void GameSession::slideLeft() {
    if (!pieceInPlay()) return;
    slide(-1);
}

void GameSession::slideRight() {
    if (!pieceInPlay()) return;
    slide(1);
}

void GameSession::rotateClockwise() {
    if (!pieceInPlay()) return;
    tryRotate(RotationDirection::Clockwise);
}

void GameSession::rotateCounterClockwise() {
    if (!pieceInPlay()) return;
    tryRotate(RotationDirection::CounterClockwise);
}

void GameSession::softDrop() {
    if (!pieceInPlay()) return;
    if (tryShift(1, 0)) {
        scoreManager_.addSoftDrop(1);
        ++softDropCells_;
        refreshGrounding();
    }
}

void GameSession::hardDrop() {
    if (!pieceInPlay()) return;

    int cells = 0;
    while (tryShift(1, 0)) {
        ++cells;
    }
    scoreManager_.addHardDrop(cells);
    hardDropCells_ += cells;

    lockPiece();
}

void GameSession::hold() {
    if (!canHold()) return;

    const TetrominoType current = active_->piece.type();
    const std::optional<TetrominoType> previous = hold_;

    hold_ = current;
    holdUsed_ = true;
    active_.reset();
    events_.push_back(HoldUsedEvent{current});

    placePiece(previous ? *previous : queue_.next());
}

bool GameSession::canHold() const noexcept {
    return config_.holdEnabled && !holdUsed_ && active_.has_value()
        && std::holds_alternative<phase::Falling>(phase_);
}

bool GameSession::tryShift(int dRow, int dCol) {
    if (!active_) return false;

    const Tetromino moved = active_->piece.shifted(dRow, dCol);
    if (!board_.canPlace(moved)) {
        return false;
    }
    active_->piece = moved;
    active_->lastAction = LastAction{};
    return true;
}

void GameSession::tryRotate(RotationDirection direction) {
    const auto result = attemptRotate(board_, active_->piece, direction);
    if (!result) {
        return;
    }
    active_->piece = result->piece;
    active_->lastAction = LastAction{true, result->kickIndex};
    onPieceAdjusted();
}

void GameSession::slide(int dCol) {
    bool moved = false;
    while (tryShift(0, dCol)) {
        moved = true;
    }
    if (moved) {
        onPieceAdjusted();
    }
}

// A successful horizontal move or rotation. Restarts the lock timer while
// the piece still has resets left.
void GameSession::onPieceAdjusted() {
    if (auto* locking = std::get_if<phase::Locking>(&phase_)) {
        if (active_->lockResets < config_.maxLockResets) {
            ++active_->lockResets;
            locking->elapsedMs = 0;
        }
    }
    refreshGrounding();
}

bool GameSession::isGrounded() const {
    return active_ && !board_.canPlace(active_->piece.shifted(1, 0));
}

// Lock timer bookkeeping after any change of position. Reaching a new lowest
// row restores the reset budget and clears the timer. Otherwise a piece that
// touches down again resumes the timer it had when it was lifted.
void GameSession::refreshGrounding() {
    if (!active_) return;

    const int bottom = bottomRow(active_->piece);
    const bool newLow = bottom > active_->lowestRow;
    if (newLow) {
        active_->lowestRow = bottom;
        active_->lockResets = 0;
        active_->lockElapsedMs = 0;
    }

    const bool grounded = isGrounded();
    if (auto* locking = std::get_if<phase::Locking>(&phase_)) {
        if (!grounded) {
            active_->lockElapsedMs = locking->elapsedMs;
            phase_ = phase::Falling{};
            gravityAccum_ = 0;
        } else if (newLow) {
            locking->elapsedMs = 0;
        }
    } else if (grounded && std::holds_alternative<phase::Falling>(phase_)) {
        phase_ = phase::Locking{active_->lockElapsedMs};
    }
}

void GameSession::lockPiece() {
    if (!active_) return;

    const Tetromino piece = active_->piece;
    const SpinType spin = config_.spinBonusEnabled
        ? detectSpin(board_, piece, active_->lastAction)
        : SpinType::None;

    board_.commit(piece);
    active_.reset();
    ++piecesLocked_;
    if (spin != SpinType::None) {
        ++spins_;
    }
    events_.push_back(PieceLockedEvent{piece.type(), spin});

    // Lock out: the whole piece came to rest above the visible area
    if (board_.hiddenRows() > 0) {
        bool allHidden = true;
        for (const auto& b : piece.blocks()) {
            if (b.row >= board_.hiddenRows()) {
                allHidden = false;
                break;
            }
        }
        if (allHidden) {
            endGame(false);
            return;
        }
    }

    const int rows = static_cast<int>(board_.clearFullRows().size());
    const ClearAward award = scoreManager_.onPieceLocked(rows, spin, level());

    if (rows == 0) {
        spawnNext();
        return;
    }

    if (rows == 4) {
        ++tetrises_;
    }
    events_.push_back(LinesClearedEvent{
        rows, spin != SpinType::None, rows == 4, spin, award.combo, award.backToBack, award.points});

    if (levelManager_.onLinesCleared(rows)) {
        events_.push_back(LevelUpEvent{level()});
    }

    if (config_.mode == GameMode::Victory && level() >= config_.victoryLevel) {
        endGame(true);
        return;
    }

    if (config_.lineClearDelayMs > 0) {
        phase_ = phase::Clearing{rows, config_.lineClearDelayMs};
        return;
    }
    spawnNext();
}

void GameSession::spawnNext() {
    phase_ = phase::Spawning{};
    holdUsed_ = false;
    placePiece(queue_.next());
}

bool GameSession::placePiece(TetrominoType type) {
    const int topRow = std::max(0, board_.hiddenRows() - 2);
    const Tetromino piece = Tetromino::spawn(type, board_.cols(), topRow);

    if (!board_.canPlace(piece)) {
        active_.reset();
        endGame(false);
        return false;
    }

    active_ = ActivePiece{piece, bottomRow(piece), 0, 0, LastAction{}};
    ++spawnCount_;
    gravityAccum_ = 0;
    phase_ = phase::Falling{};
    refreshGrounding();
    return true;
}

void GameSession::endGame(bool victory) {
    phase_ = phase::GameOver{victory};
    events_.push_back(GameEndedEvent{victory});
}

std::optional<Tetromino> GameSession::activePiece() const {
    if (!active_) return std::nullopt;
    return active_->piece;
}

std::optional<Tetromino> GameSession::ghostPiece() const {
    if (!config_.ghostEnabled || !active_) return std::nullopt;

    Tetromino ghost = active_->piece;
    while (board_.canPlace(ghost.shifted(1, 0))) {
        ghost = ghost.shifted(1, 0);
    }
    return ghost;
}

std::vector<TetrominoType> GameSession::preview() const {
    return queue_.peek(config_.previewCount);
}

int GameSession::gravityIntervalMs() const {
    return gravity_.intervalMs(level(), config_.frameRateHz);
}

GamePhase GameSession::phase() const noexcept {
    return static_cast<GamePhase>(phase_.index());
}

SessionSnapshot GameSession::snapshot() const {
    SessionSnapshot snap;
    snap.rows = board_.rows();
    snap.cols = board_.cols();
    snap.hiddenRows = board_.hiddenRows();
    snap.cells.reserve(static_cast<std::size_t>(snap.rows * snap.cols));
    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            snap.cells.push_back(board_.cellType(r, c));
        }
    }

    snap.active = activePiece();
    snap.ghost = ghostPiece();
    snap.hold = hold_;
    snap.holdAvailable = canHold();
    snap.preview = preview();

    snap.score = score();
    snap.level = level();
    snap.linesCleared = linesCleared();
    snap.phase = phase();
    return snap;
}

SessionSummary GameSession::summary() const {
    SessionSummary s;
    s.score = score();
    s.level = level();
    s.lines = linesCleared();
    s.piecesLocked = piecesLocked_;
    s.tetrises = tetrises_;
    s.spins = spins_;
    s.maxCombo = scoreManager_.maxCombo();
    s.backToBacks = scoreManager_.backToBackCount();
    s.softDropCells = softDropCells_;
    s.hardDropCells = hardDropCells_;
    s.playTimeMs = playTimeMs_;
    if (const auto* over = std::get_if<phase::GameOver>(&phase_)) {
        s.finished = true;
        s.victory = over->victory;
    }
    return s;
}

std::vector<GameEvent> GameSession::drainEvents() {
    std::vector<GameEvent> out;
    out.swap(events_);
    return out;
}

} // namespace stackfall::core
