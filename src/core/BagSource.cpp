#include "core/BagSource.hpp"
#include <algorithm>

namespace stackfall::core {

SevenBagSource::SevenBagSource(std::uint32_t seed)
    : rng_{seed}
{
}

std::vector<TetrominoType> SevenBagSource::nextBag() {
    std::vector<TetrominoType> bag(AllTetrominoTypes.begin(), AllTetrominoTypes.end());
    std::shuffle(bag.begin(), bag.end(), rng_);
    return bag;
}

} // namespace stackfall::core
