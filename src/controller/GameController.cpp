#include "controller/GameController.hpp"

namespace stackfall::controller {

GameController::GameController(stackfall::core::GameSession& session)
    : session_{session}
{
}

void GameController::handleAction(InputAction action) {
    // After game over only an external reset + start brings the session back.
    if (session_.isGameOver()) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        session_.moveLeft();
        break;
    case InputAction::MoveRight:
        session_.moveRight();
        break;
    case InputAction::SlideLeft:
        session_.slideLeft();
        break;
    case InputAction::SlideRight:
        session_.slideRight();
        break;
    case InputAction::SoftDrop:
        session_.softDrop();
        break;
    case InputAction::HardDrop:
        session_.hardDrop();
        break;
    case InputAction::RotateCW:
        session_.rotateClockwise();
        break;
    case InputAction::RotateCCW:
        session_.rotateCounterClockwise();
        break;
    case InputAction::Hold:
        session_.hold();
        break;
    case InputAction::PauseResume:
        session_.togglePause();
        break;
    }
}

void GameController::update(const InputSnapshot& input, Duration elapsed) {
    session_.update(input, elapsed);
}

void GameController::update(Duration elapsed) {
    session_.update(InputSnapshot{}, elapsed);
}

} // namespace stackfall::controller
