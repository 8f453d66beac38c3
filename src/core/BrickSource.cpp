#include "core/BrickSource.hpp"
#include <random>

namespace brickfall::core {

RandomBrickSource::RandomBrickSource(std::optional<std::uint32_t> seed)
    : rng_{seed ? *seed : std::random_device{}()}
{
}

BrickType RandomBrickSource::next() {
    std::uniform_int_distribution<int> dist(0, BrickTypeCount - 1); // 7 types
    return AllBrickTypes[static_cast<std::size_t>(dist(rng_))];
}

} // namespace brickfall::core
