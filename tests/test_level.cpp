#include <catch2/catch_test_macros.hpp>

#include "core/LevelManager.hpp"

#include <stdexcept>

using namespace stackfall::core;

TEST_CASE("LevelManager levels up every levelUpLines lines", "[level]") {
    LevelManager lm{1, 10, 20};

    REQUIRE(lm.level() == 1);

    CHECK_FALSE(lm.onLinesCleared(4));
    CHECK_FALSE(lm.onLinesCleared(4));
    CHECK(lm.linesSinceLevelUp() == 8);

    CHECK(lm.onLinesCleared(3));
    CHECK(lm.level() == 2);
    // The extra line carries into the next level
    CHECK(lm.linesSinceLevelUp() == 1);
    CHECK(lm.totalLinesCleared() == 11);
}

TEST_CASE("LevelManager rises at most one level per clear", "[level]") {
    LevelManager lm{1, 2, 20};

    CHECK(lm.onLinesCleared(4));
    CHECK(lm.level() == 2);
    CHECK(lm.linesSinceLevelUp() == 2);

    // The backlog is paid out on the next clear
    CHECK(lm.onLinesCleared(1));
    CHECK(lm.level() == 3);
    CHECK(lm.linesSinceLevelUp() == 1);
}

TEST_CASE("LevelManager stops at the maximum level", "[level]") {
    LevelManager lm{2, 1, 3};

    CHECK(lm.onLinesCleared(1));
    CHECK(lm.level() == 3);
    CHECK_FALSE(lm.onLinesCleared(4));
    CHECK(lm.level() == 3);
    CHECK(lm.totalLinesCleared() == 5);
}

TEST_CASE("LevelManager reset returns to the starting level", "[level]") {
    LevelManager lm{5, 10, 20};
    lm.onLinesCleared(10);
    REQUIRE(lm.level() == 6);

    lm.reset();
    CHECK(lm.level() == 5);
    CHECK(lm.linesSinceLevelUp() == 0);
    CHECK(lm.totalLinesCleared() == 0);
}

TEST_CASE("LevelManager ignores non-positive line counts", "[level]") {
    LevelManager lm{1, 10, 20};
    CHECK_FALSE(lm.onLinesCleared(0));
    CHECK_FALSE(lm.onLinesCleared(-2));
    CHECK(lm.totalLinesCleared() == 0);
}

TEST_CASE("LevelManager rejects bad parameters", "[level]") {
    REQUIRE_THROWS_AS(LevelManager(0, 10, 20), std::invalid_argument);
    REQUIRE_THROWS_AS(LevelManager(21, 10, 20), std::invalid_argument);
    REQUIRE_THROWS_AS(LevelManager(1, 0, 20), std::invalid_argument);
}
