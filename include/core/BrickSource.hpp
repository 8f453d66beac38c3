#pragma once

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <random>

namespace brickfall::core {

// Supplies the type of every new brick. The reducer's only source of
// nondeterminism; tests inject a fixed sequence.
class IBrickSource {
public:
    virtual ~IBrickSource() = default;

    // Next brick type, uniform over the 7 types
    virtual BrickType next() = 0;
};

class RandomBrickSource final : public IBrickSource {
public:
    // Seeded from std::random_device when no seed is given
    explicit RandomBrickSource(std::optional<std::uint32_t> seed = std::nullopt);

    BrickType next() override;

private:
    std::mt19937 rng_;
};

} // namespace brickfall::core
