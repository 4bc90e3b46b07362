#include <catch2/catch_test_macros.hpp>

#include "core/GameConfig.hpp"
#include "core/GravityTable.hpp"

#include <stdexcept>

using namespace stackfall::core;

namespace {

GravityTable defaultCurve() {
    return GravityTable{GameConfig{}.gravityTable};
}

} // namespace

TEST_CASE("Default gravity curve", "[gravity]") {
    const GravityTable g = defaultCurve();

    CHECK(g.maxLevel() == 20);
    CHECK(g.framesPerCell(1) == 60);
    CHECK(g.framesPerCell(10) == 8);
    CHECK(g.framesPerCell(20) == 1);
}

TEST_CASE("Gravity never slows down as the level rises", "[gravity]") {
    const GravityTable g = defaultCurve();
    for (int level = 2; level <= 30; ++level) {
        REQUIRE(g.framesPerCell(level) <= g.framesPerCell(level - 1));
    }
}

TEST_CASE("Gravity levels beyond the table reuse the last entry", "[gravity]") {
    const GravityTable g{std::vector<int>{30, 20, 10}};
    CHECK(g.framesPerCell(3) == 10);
    CHECK(g.framesPerCell(99) == 10);
    REQUIRE_THROWS_AS(g.framesPerCell(0), std::out_of_range);
}

TEST_CASE("Gravity interval in milliseconds", "[gravity]") {
    const GravityTable g = defaultCurve();
    CHECK(g.intervalMs(1, 60) == 1000);
    CHECK(g.intervalMs(4, 60) == 500);
    CHECK(g.intervalMs(1, 50) == 1200);
    REQUIRE_THROWS_AS(g.intervalMs(1, 0), std::invalid_argument);
}

TEST_CASE("Gravity table rejects invalid curves", "[gravity]") {
    REQUIRE_THROWS_AS(GravityTable(std::vector<int>{}), std::invalid_argument);
    REQUIRE_THROWS_AS(GravityTable(std::vector<int>{10, 0}), std::invalid_argument);
    REQUIRE_THROWS_AS(GravityTable(std::vector<int>{10, 20}), std::invalid_argument);
    REQUIRE_NOTHROW(GravityTable(std::vector<int>{10, 10, 5}));
}
