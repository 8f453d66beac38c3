#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/Types.hpp"

namespace brickfall::controller {

struct GameConfig {
    double ticksPerSecond{core::DefaultTicksPerSecond}; // gravity pace
    std::optional<std::uint32_t> seed;                  // fixed brick sequence when set

    int windowWidth{900};   // desktop front-end only
    int windowHeight{700};

    bool showProjection{true}; // draw where a hard drop would land
    bool verbose{false};       // log every row clear
    bool showHelp{false};
};

/// Parses command-line flags. Throws std::invalid_argument on unknown
/// flags, missing values or values out of range.
GameConfig parseArgs(int argc, const char* const argv[]);

std::string usage(const std::string& program);

// Upper bound for one console "t N" command
constexpr int MaxTicksPerCommand = core::GridHeight * 10;

/// Tick count of a console "t N" command. std::nullopt unless the text is a
/// positive integer; larger counts are clamped to MaxTicksPerCommand.
std::optional<int> parseTickCount(const std::string& text);

} // namespace brickfall::controller
