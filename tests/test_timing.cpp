#include <catch2/catch_test_macros.hpp>

#include "controller/InputAction.hpp"
#include "controller/TimingController.hpp"

#include <algorithm>
#include <vector>

using namespace stackfall::controller;
using Ms = TimingController::Duration;

namespace {

InputSnapshot leftHeld() {
    InputSnapshot in;
    in.moveLeft = true;
    return in;
}

InputSnapshot rightHeld() {
    InputSnapshot in;
    in.moveRight = true;
    return in;
}

InputSnapshot bothHeld() {
    InputSnapshot in;
    in.moveLeft = true;
    in.moveRight = true;
    return in;
}

long count(const std::vector<InputAction>& actions, InputAction a) {
    return std::count(actions.begin(), actions.end(), a);
}

} // namespace

TEST_CASE("DAS: press moves once, repeats start exactly at the DAS delay", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};

    // The press frame moves immediately; its elapsed time does not charge DAS
    CHECK(t.update(leftHeld(), Ms{16}) == std::vector<InputAction>{InputAction::MoveLeft});
    CHECK(t.dasCharge(InputAction::MoveLeft) == Ms{0});

    CHECK(t.update(leftHeld(), Ms{169}).empty());
    CHECK(t.dasCharge(InputAction::MoveLeft) == Ms{169});

    CHECK(t.update(leftHeld(), Ms{1}) == std::vector<InputAction>{InputAction::MoveLeft});

    SECTION("ARR paces the following repeats") {
        CHECK(t.update(leftHeld(), Ms{29}).empty());
        CHECK(count(t.update(leftHeld(), Ms{1}), InputAction::MoveLeft) == 1);
        CHECK(count(t.update(leftHeld(), Ms{90}), InputAction::MoveLeft) == 3);
    }

    SECTION("A long frame catches up on every repeat it covered") {
        // Charge 170 -> 270: repeats at 200, 230, 260
        CHECK(count(t.update(leftHeld(), Ms{100}), InputAction::MoveLeft) == 3);
    }
}

TEST_CASE("DAS: a long first frame past the delay repeats from the DAS mark", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};
    t.update(rightHeld(), Ms{0});

    // Charge 0 -> 235: repeats at 170, 200, 230
    CHECK(count(t.update(rightHeld(), Ms{235}), InputAction::MoveRight) == 3);
}

TEST_CASE("ARR of zero slides to the wall once charged", "[timing]") {
    TimingController t{TimingSettings{170, 0, 50}};

    CHECK(t.update(rightHeld(), Ms{16}) == std::vector<InputAction>{InputAction::MoveRight});
    CHECK(t.update(rightHeld(), Ms{150}).empty());
    CHECK(t.update(rightHeld(), Ms{20}) == std::vector<InputAction>{InputAction::SlideRight});
    CHECK(t.update(rightHeld(), Ms{16}) == std::vector<InputAction>{InputAction::SlideRight});
}

TEST_CASE("Releasing a direction resets its timers", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};

    t.update(leftHeld(), Ms{16});
    t.update(leftHeld(), Ms{160});
    REQUIRE(t.dasCharge(InputAction::MoveLeft) == Ms{160});

    CHECK(t.update(InputSnapshot{}, Ms{16}).empty());
    CHECK(t.dasCharge(InputAction::MoveLeft) == Ms{0});

    // Fresh press: immediate move, then the full DAS again
    CHECK(t.update(leftHeld(), Ms{16}) == std::vector<InputAction>{InputAction::MoveLeft});
    CHECK(t.update(leftHeld(), Ms{169}).empty());
    CHECK(count(t.update(leftHeld(), Ms{1}), InputAction::MoveLeft) == 1);
}

TEST_CASE("Pressing the opposite direction takes over and restarts DAS", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};

    t.update(leftHeld(), Ms{16});
    t.update(leftHeld(), Ms{200});

    CHECK(t.update(bothHeld(), Ms{16}) == std::vector<InputAction>{InputAction::MoveRight});
    CHECK(t.dasCharge(InputAction::MoveLeft) == Ms{0});
    CHECK(t.dasCharge(InputAction::MoveRight) == Ms{0});

    CHECK(t.update(bothHeld(), Ms{169}).empty());
    CHECK(t.update(bothHeld(), Ms{1}) == std::vector<InputAction>{InputAction::MoveRight});

    SECTION("Letting go of the newer direction hands back to the older one without a move") {
        CHECK(t.update(leftHeld(), Ms{0}).empty());
        CHECK(t.update(leftHeld(), Ms{169}).empty());
        CHECK(t.update(leftHeld(), Ms{1}) == std::vector<InputAction>{InputAction::MoveLeft});
    }
}

TEST_CASE("Both directions pressed on the same frame cancel out", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};

    CHECK(t.update(bothHeld(), Ms{16}).empty());
    CHECK(t.update(bothHeld(), Ms{500}).empty());

    // Once one side is released the other starts charging from zero
    CHECK(t.update(rightHeld(), Ms{0}).empty());
    CHECK(t.update(rightHeld(), Ms{170}) == std::vector<InputAction>{InputAction::MoveRight});
}

TEST_CASE("Soft drop repeats on its own interval", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};
    InputSnapshot down;
    down.softDrop = true;

    CHECK_FALSE(t.softDropHeld());
    CHECK(t.update(down, Ms{16}) == std::vector<InputAction>{InputAction::SoftDrop});
    CHECK(t.softDropHeld());

    CHECK(t.update(down, Ms{49}).empty());
    CHECK(t.update(down, Ms{1}) == std::vector<InputAction>{InputAction::SoftDrop});
    CHECK(count(t.update(down, Ms{100}), InputAction::SoftDrop) == 2);

    t.update(InputSnapshot{}, Ms{16});
    CHECK_FALSE(t.softDropHeld());
}

TEST_CASE("Edge-triggered buttons fire once per press", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};
    InputSnapshot in;
    in.rotateCW = true;
    in.hardDrop = true;

    CHECK(t.update(in, Ms{16}) == std::vector<InputAction>{InputAction::RotateCW, InputAction::HardDrop});
    for (int i = 0; i < 30; ++i) {
        REQUIRE(t.update(in, Ms{16}).empty());
    }

    t.update(InputSnapshot{}, Ms{16});
    CHECK(t.update(in, Ms{16}) == std::vector<InputAction>{InputAction::RotateCW, InputAction::HardDrop});

    SECTION("reset forgets the held state") {
        t.reset();
        CHECK(t.update(in, Ms{16}) == std::vector<InputAction>{InputAction::RotateCW, InputAction::HardDrop});
    }
}

TEST_CASE("Actions of one frame come out in priority order", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};
    InputSnapshot all;
    all.pause = true;
    all.hold = true;
    all.rotateCW = true;
    all.rotateCCW = true;
    all.moveLeft = true;
    all.softDrop = true;
    all.hardDrop = true;

    const std::vector<InputAction> expected{
        InputAction::PauseResume,
        InputAction::Hold,
        InputAction::RotateCW,
        InputAction::RotateCCW,
        InputAction::MoveLeft,
        InputAction::SoftDrop,
        InputAction::HardDrop,
    };
    CHECK(t.update(all, Ms{16}) == expected);
}

TEST_CASE("Polling pause takes only the pause edge", "[timing]") {
    TimingController t{TimingSettings{170, 30, 50}};

    InputSnapshot in = leftHeld();
    in.pause = true;

    CHECK(t.pollPause(in));
    CHECK_FALSE(t.pollPause(in));            // held, no new edge

    // The left press was not sampled yet: it still moves, without a PauseResume
    CHECK(t.update(in, Ms{16}) == std::vector<InputAction>{InputAction::MoveLeft});
    CHECK(t.dasCharge(InputAction::MoveLeft) == Ms{0});

    in.pause = false;
    CHECK_FALSE(t.pollPause(in));
    in.pause = true;
    CHECK(t.pollPause(in));
}

TEST_CASE("Identical input and time sequences produce identical actions", "[timing]") {
    TimingController a{TimingSettings{133, 17, 41}};
    TimingController b{TimingSettings{133, 17, 41}};

    for (int frame = 0; frame < 600; ++frame) {
        InputSnapshot in;
        in.moveLeft = (frame / 37) % 2 == 0;
        in.moveRight = (frame / 53) % 3 == 1;
        in.softDrop = (frame / 29) % 4 == 2;
        in.rotateCW = frame % 11 == 0;
        in.hardDrop = frame % 97 == 96;
        const Ms dt{10 + frame % 7};

        REQUIRE(a.update(in, dt) == b.update(in, dt));
    }
}
