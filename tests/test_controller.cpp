// tests/test_controller.cpp

#include <catch2/catch_test_macros.hpp>

#include "FakeBagSource.hpp"

#include "core/GameConfig.hpp"
#include "core/GameSession.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"

#include <memory>

using stackfall::core::GameConfig;
using stackfall::core::GamePhase;
using stackfall::core::GameSession;
using stackfall::core::TetrominoType;
using stackfall::controller::GameController;
using stackfall::controller::InputAction;
using stackfall::controller::InputSnapshot;

namespace {

GameConfig controllerConfig() {
    GameConfig config;
    config.hiddenRows = 0;
    config.lineClearDelayMs = 0;
    return config;
}

std::unique_ptr<FakeBagSource> tPieces() {
    return std::make_unique<FakeBagSource>(
        FakeBagSource::Bags{std::vector<TetrominoType>{TetrominoType::T, TetrominoType::S}});
}

} // namespace

TEST_CASE("GameController maps lateral input actions to session movement", "[controller]")
{
    GameSession session{controllerConfig(), tPieces()};
    GameController controller{session};

    session.start();
    REQUIRE(session.phase() == GamePhase::Falling);
    REQUIRE(session.activePiece().has_value());

    auto before = session.activePiece()->origin();

    controller.handleAction(InputAction::MoveLeft);
    auto afterLeft = session.activePiece()->origin();

    REQUIRE(afterLeft.row == before.row);
    REQUIRE(afterLeft.col == before.col - 1);

    // Back to the original column
    controller.handleAction(InputAction::MoveRight);
    auto afterRight = session.activePiece()->origin();

    REQUIRE(afterRight.row == before.row);
    REQUIRE(afterRight.col == before.col);

    controller.handleAction(InputAction::SlideLeft);
    REQUIRE(session.activePiece()->origin().col == 1);
}

TEST_CASE("GameController maps rotation, drops and hold", "[controller]")
{
    GameSession session{controllerConfig(), tPieces()};
    GameController controller{session};
    session.start();

    controller.handleAction(InputAction::RotateCW);
    REQUIRE(session.activePiece()->rotation() == stackfall::core::Rotation::R90);
    controller.handleAction(InputAction::RotateCCW);
    REQUIRE(session.activePiece()->rotation() == stackfall::core::Rotation::R0);

    const int row = session.activePiece()->origin().row;
    controller.handleAction(InputAction::SoftDrop);
    REQUIRE(session.activePiece()->origin().row == row + 1);

    controller.handleAction(InputAction::Hold);
    REQUIRE(session.holdPiece() == TetrominoType::T);
    REQUIRE(session.activePiece()->type() == TetrominoType::S);

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(session.lockedPieces() == 1);
}

TEST_CASE("GameController toggles pause/resume", "[controller]")
{
    GameSession session{controllerConfig()};
    GameController controller{session};

    session.start();
    REQUIRE(session.phase() == GamePhase::Falling);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(session.phase() == GamePhase::Paused);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(session.phase() == GamePhase::Falling);
}

TEST_CASE("GameController update applies gravity based on the session interval", "[controller]")
{
    GameSession session{controllerConfig()};
    GameController controller{session};

    session.start();
    REQUIRE(session.activePiece().has_value());

    const int intervalMs = session.gravityIntervalMs();
    REQUIRE(intervalMs > 0);

    auto before = session.activePiece()->origin();

    // Exactly one gravity interval
    controller.update(GameController::Duration{intervalMs});

    REQUIRE(session.activePiece().has_value());
    auto after = session.activePiece()->origin();

    REQUIRE(after.row == before.row + 1);
    REQUIRE(after.col == before.col);
}

TEST_CASE("GameController update does not move piece when paused", "[controller]")
{
    GameSession session{controllerConfig()};
    GameController controller{session};

    session.start();
    REQUIRE(session.activePiece().has_value());

    const int intervalMs = session.gravityIntervalMs();
    auto before = session.activePiece()->origin();

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(session.phase() == GamePhase::Paused);

    // Time passes, the piece stays put
    controller.update(GameController::Duration{intervalMs * 3});

    REQUIRE(session.activePiece().has_value());
    auto after = session.activePiece()->origin();

    REQUIRE(after.row == before.row);
    REQUIRE(after.col == before.col);
}

TEST_CASE("GameController handles multiple gravity ticks on large elapsed time", "[controller]")
{
    GameSession session{controllerConfig()};
    GameController controller{session};

    session.start();
    REQUIRE(session.activePiece().has_value());

    const int intervalMs = session.gravityIntervalMs();
    auto before = session.activePiece()->origin();

    const int factor = 3;
    controller.update(GameController::Duration{intervalMs * factor});

    REQUIRE(session.activePiece().has_value());
    auto after = session.activePiece()->origin();

    // Spawned near the top of an empty board: one row per interval
    REQUIRE(after.row == before.row + factor);
    REQUIRE(after.col == before.col);
}

TEST_CASE("GameController frame input goes through DAS", "[controller]")
{
    GameSession session{controllerConfig()};
    GameController controller{session};
    session.start();

    InputSnapshot left;
    left.moveLeft = true;

    const int col = session.activePiece()->origin().col;
    controller.update(left, GameController::Duration{16});
    REQUIRE(session.activePiece()->origin().col == col - 1);

    // Held below the DAS delay: no further movement
    controller.update(left, GameController::Duration{100});
    REQUIRE(session.activePiece()->origin().col == col - 1);
}

TEST_CASE("GameController ignores actions after game over", "[controller]")
{
    GameConfig config = controllerConfig();
    config.cols = 4;
    config.mode = stackfall::core::GameMode::Victory;
    config.levelUpLines = 1;
    config.victoryLevel = 2;
    GameSession session{config, std::make_unique<FakeBagSource>(
        FakeBagSource::Bags{std::vector<TetrominoType>{TetrominoType::I}})};
    GameController controller{session};
    session.start();

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(session.isGameOver());

    controller.handleAction(InputAction::PauseResume);
    controller.handleAction(InputAction::HardDrop);
    REQUIRE(session.isGameOver());
    REQUIRE(session.lockedPieces() == 1);
}
