#include "controller/TimingController.hpp"

namespace stackfall::controller {

namespace {

bool risingEdge(bool now, bool& previous) {
    const bool edge = now && !previous;
    previous = now;
    return edge;
}

} // namespace

TimingController::TimingController(TimingSettings settings)
    : settings_{settings}
{
}

std::vector<InputAction> TimingController::update(const InputSnapshot& input, Duration elapsed) {
    std::vector<InputAction> out;

    if (risingEdge(input.pause, prevPause_)) {
        out.push_back(InputAction::PauseResume);
    }
    if (risingEdge(input.hold, prevHold_)) {
        out.push_back(InputAction::Hold);
    }
    if (risingEdge(input.rotateCW, prevRotateCW_)) {
        out.push_back(InputAction::RotateCW);
    }
    if (risingEdge(input.rotateCCW, prevRotateCCW_)) {
        out.push_back(InputAction::RotateCCW);
    }

    updateHorizontal(input, elapsed, out);
    updateSoftDrop(input.softDrop, elapsed, out);

    if (risingEdge(input.hardDrop, prevHardDrop_)) {
        out.push_back(InputAction::HardDrop);
    }

    return out;
}

bool TimingController::pollPause(const InputSnapshot& input) {
    return risingEdge(input.pause, prevPause_);
}

void TimingController::updateHorizontal(const InputSnapshot& input, Duration elapsed,
                                        std::vector<InputAction>& out)
{
    const bool leftEdge = input.moveLeft && !left_.held;
    const bool rightEdge = input.moveRight && !right_.held;

    // Release resets that direction completely
    if (!input.moveLeft) left_ = DirectionTimer{};
    if (!input.moveRight) right_ = DirectionTimer{};

    if (leftEdge && rightEdge) {
        // Pressed together: neither wins until one is let go.
        left_ = DirectionTimer{true, Duration{0}, Duration{0}};
        right_ = DirectionTimer{true, Duration{0}, Duration{0}};
        active_ = Direction::None;
        return;
    }

    if (leftEdge) {
        left_ = DirectionTimer{true, Duration{0}, Duration{0}};
        right_.charge = right_.repeatAcc = Duration{0};
        active_ = Direction::Left;
        out.push_back(InputAction::MoveLeft);
        return;
    }

    if (rightEdge) {
        right_ = DirectionTimer{true, Duration{0}, Duration{0}};
        left_.charge = left_.repeatAcc = Duration{0};
        active_ = Direction::Right;
        out.push_back(InputAction::MoveRight);
        return;
    }

    // The active direction was released: fall back to the other one if still held.
    // It starts charging from zero, without an immediate move.
    if (active_ == Direction::Left && !left_.held) {
        active_ = right_.held ? Direction::Right : Direction::None;
    } else if (active_ == Direction::Right && !right_.held) {
        active_ = left_.held ? Direction::Left : Direction::None;
    } else if (active_ == Direction::None && left_.held != right_.held) {
        active_ = left_.held ? Direction::Left : Direction::Right;
    }

    if (active_ == Direction::Left) {
        autoRepeat(left_, elapsed, InputAction::MoveLeft, InputAction::SlideLeft, out);
    } else if (active_ == Direction::Right) {
        autoRepeat(right_, elapsed, InputAction::MoveRight, InputAction::SlideRight, out);
    }
}

void TimingController::autoRepeat(DirectionTimer& timer, Duration elapsed, InputAction move,
                                  InputAction slide, std::vector<InputAction>& out)
{
    const Duration das{settings_.dasDelayMs};
    const Duration arr{settings_.arrDelayMs};

    const Duration before = timer.charge;
    timer.charge += elapsed;
    if (timer.charge < das) {
        return;
    }

    if (arr.count() == 0) {
        out.push_back(slide);
        return;
    }

    if (before < das) {
        // DAS expired during this frame: first repeat lands exactly on the DAS mark.
        timer.repeatAcc = timer.charge - das + arr;
    } else {
        timer.repeatAcc += elapsed;
    }

    while (timer.repeatAcc >= arr) {
        out.push_back(move);
        timer.repeatAcc -= arr;
    }
}

void TimingController::updateSoftDrop(bool held, Duration elapsed, std::vector<InputAction>& out) {
    if (!held) {
        softDrop_ = RepeatTimer{};
        return;
    }

    if (!softDrop_.held) {
        softDrop_.held = true;
        softDrop_.acc = Duration{0};
        out.push_back(InputAction::SoftDrop);
        return;
    }

    const Duration interval{settings_.softDropIntervalMs};
    softDrop_.acc += elapsed;
    while (interval.count() > 0 && softDrop_.acc >= interval) {
        out.push_back(InputAction::SoftDrop);
        softDrop_.acc -= interval;
    }
}

TimingController::Duration TimingController::dasCharge(InputAction direction) const noexcept {
    if (direction == InputAction::MoveLeft && active_ == Direction::Left) {
        return left_.charge;
    }
    if (direction == InputAction::MoveRight && active_ == Direction::Right) {
        return right_.charge;
    }
    return Duration{0};
}

void TimingController::reset() {
    left_ = DirectionTimer{};
    right_ = DirectionTimer{};
    active_ = Direction::None;
    softDrop_ = RepeatTimer{};
    prevHardDrop_ = false;
    prevRotateCW_ = false;
    prevRotateCCW_ = false;
    prevHold_ = false;
    prevPause_ = false;
}

} // namespace stackfall::controller
