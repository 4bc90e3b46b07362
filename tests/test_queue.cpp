#include <catch2/catch_test_macros.hpp>

#include "core/BagSource.hpp"
#include "core/PieceQueue.hpp"
#include "core/Types.hpp"
#include "FakeBagSource.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace stackfall::core;

namespace {

std::array<int, TetrominoTypeCount> countTypes(const std::vector<TetrominoType>& draws,
                                               std::size_t from, std::size_t count) {
    std::array<int, TetrominoTypeCount> counts{};
    for (std::size_t i = from; i < from + count; ++i) {
        ++counts[static_cast<std::size_t>(draws[i])];
    }
    return counts;
}

std::vector<TetrominoType> drawMany(PieceQueue& q, int n) {
    std::vector<TetrominoType> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(q.next());
    }
    return out;
}

} // namespace

TEST_CASE("SevenBagSource yields every type once per bag", "[queue]") {
    SevenBagSource source{1234};

    for (int bag = 0; bag < 20; ++bag) {
        auto types = source.nextBag();
        REQUIRE(types.size() == 7);
        std::sort(types.begin(), types.end());
        REQUIRE(std::equal(types.begin(), types.end(), AllTetrominoTypes.begin()));
    }
}

TEST_CASE("SevenBagSource is deterministic for a seed", "[queue]") {
    SevenBagSource a{42};
    SevenBagSource b{42};
    for (int i = 0; i < 10; ++i) {
        REQUIRE(a.nextBag() == b.nextBag());
    }
}

TEST_CASE("PieceQueue bounds piece starvation", "[queue]") {
    PieceQueue q{std::make_unique<SevenBagSource>(7), 3};
    const auto draws = drawMany(q, 7 * 40);

    SECTION("Two consecutive bags hold each type exactly twice") {
        for (std::size_t start = 0; start + 14 <= draws.size(); start += 7) {
            for (int n : countTypes(draws, start, 14)) {
                REQUIRE(n == 2);
            }
        }
    }

    SECTION("Any 14 consecutive draws hold each type one to three times") {
        for (std::size_t start = 0; start + 14 <= draws.size(); ++start) {
            for (int n : countTypes(draws, start, 14)) {
                REQUIRE(n >= 1);
                REQUIRE(n <= 3);
            }
        }
    }

    SECTION("The same type never shows up more than twice in a row") {
        for (std::size_t i = 2; i < draws.size(); ++i) {
            REQUIRE_FALSE((draws[i] == draws[i - 1] && draws[i] == draws[i - 2]));
        }
    }
}

TEST_CASE("PieceQueue keeps the preview window filled", "[queue]") {
    FakeBagSource::Bags bags{
        {TetrominoType::T, TetrominoType::S, TetrominoType::Z},
        {TetrominoType::I, TetrominoType::O},
    };
    PieceQueue q{std::make_unique<FakeBagSource>(bags), 4};

    // Two whole bags needed to cover 5 entries
    REQUIRE(q.size() == 5);

    CHECK(q.next() == TetrominoType::T);
    // One short: refilled with a whole bag, never a partial one
    CHECK(q.size() == 7);
    CHECK(q.peek(4) == std::vector<TetrominoType>{
        TetrominoType::S, TetrominoType::Z, TetrominoType::I, TetrominoType::O});
}

TEST_CASE("PieceQueue peek has no side effects", "[queue]") {
    PieceQueue a{std::make_unique<SevenBagSource>(99), 5};
    PieceQueue b{std::make_unique<SevenBagSource>(99), 5};

    const auto preview = a.peek(5);
    REQUIRE(preview.size() == 5);
    REQUIRE(a.peek(5) == preview);
    for (int i = 0; i < 10; ++i) {
        (void)a.peek(3);
    }

    for (int i = 0; i < 30; ++i) {
        REQUIRE(a.next() == b.next());
    }

    SECTION("peek is clamped to the window") {
        CHECK(a.peek(-1).empty());
        CHECK(a.peek(100).size() == 6);
    }
}

TEST_CASE("PieceQueue rejects bad construction", "[queue]") {
    REQUIRE_THROWS_AS(PieceQueue(nullptr, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(PieceQueue(std::make_unique<SevenBagSource>(1), -1), std::invalid_argument);
    REQUIRE_THROWS_AS(PieceQueue(std::make_unique<FakeBagSource>(FakeBagSource::Bags{std::vector<TetrominoType>{}}), 1),
                      std::logic_error);
}
