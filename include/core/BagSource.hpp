#pragma once

#include "Types.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace stackfall::core {

// Supplies the piece queue with one bag of upcoming types at a time.
class IBagSource {
public:
    virtual ~IBagSource() = default;

    // Next bag, in draw order. Must not be empty.
    virtual std::vector<TetrominoType> nextBag() = 0;
};

// 7-bag randomizer: every bag is a uniform shuffle of all seven types.
class SevenBagSource : public IBagSource {
public:
    explicit SevenBagSource(std::uint32_t seed);

    std::vector<TetrominoType> nextBag() override;

private:
    std::mt19937 rng_;
};

} // namespace stackfall::core
