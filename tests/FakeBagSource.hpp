#pragma once

#include "core/BagSource.hpp"
#include "core/Types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

// Bag source that hands out scripted bags in order and then starts over.
// Lets tests pin the exact piece sequence the session sees.
class FakeBagSource : public stackfall::core::IBagSource {
public:
    using Bags = std::vector<std::vector<stackfall::core::TetrominoType>>;

    explicit FakeBagSource(Bags bags)
        : bags_(std::move(bags))
    {
    }

    std::vector<stackfall::core::TetrominoType> nextBag() override {
        const auto& bag = bags_[next_];
        next_ = (next_ + 1) % bags_.size();
        return bag;
    }

private:
    Bags bags_;
    std::size_t next_{0};
};
