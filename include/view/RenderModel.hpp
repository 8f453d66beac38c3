#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "core/GameState.hpp"
#include "core/Types.hpp"

namespace brickfall::view {

enum class CellKind : std::uint8_t {
    Empty,
    Settled,    // locked brick cell
    Animated,   // cell of a complete row, highlighted during the blink
    Falling,    // the falling brick
    Projection  // where a hard drop would land
};

struct RenderCell {
    CellKind kind{CellKind::Empty};
    std::optional<core::BrickType> type;
};

// Everything a presenter needs to draw one frame. Built from a GameState,
// which is never modified.
struct RenderModel {
    core::GamePhase phase{core::GamePhase::Unstarted};
    std::array<std::array<RenderCell, core::GridWidth>, core::GridHeight> cells{};
    core::BrickQueue queue{};
    std::uint64_t score{0};
};

RenderModel buildRenderModel(const core::GameState& state, bool showProjection = true);

// True while a complete row is in its highlighted half of the blink
bool isRowHighlighted(const core::GameState& state, int y);

// Where the falling brick would rest after a hard drop; std::nullopt when
// unspawned or already resting.
std::optional<core::FallingBrick> projectionOf(const core::GameState& state);

std::string scoreText(std::uint64_t score);

// Phase label; an unknown phase is a programming error
const char* phaseName(core::GamePhase phase);

} // namespace brickfall::view
