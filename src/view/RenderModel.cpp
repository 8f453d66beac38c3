#include "view/RenderModel.hpp"

#include <cassert>

namespace brickfall::view {

namespace {

using core::BrickShape;
using core::FallingBrick;
using core::GridHeight;
using core::GridWidth;

void overlayBrick(RenderModel& model, const FallingBrick& brick, CellKind kind)
{
    const BrickShape shape = brick.shape();
    for (int y = 0; y < shape.size(); ++y) {
        for (int x = 0; x < shape.size(); ++x) {
            if (!shape.at(y, x)) continue;

            // Cells above the board stay hidden
            const int gx = brick.x() + x;
            const int gy = brick.y() + y;
            if (gy < 0 || gy >= GridHeight || gx < 0 || gx >= GridWidth) continue;

            model.cells[gy][gx] = RenderCell{kind, brick.type()};
        }
    }
}

} // namespace

bool isRowHighlighted(const core::GameState& state, int y)
{
    if (!state.isRowAnimating() || !core::isRowComplete(state.grid.row(y))) {
        return false;
    }
    const int phase = *state.completedRowAnimationFrame / core::RowAnimationInterval;
    return phase % 2 == 0;
}

std::optional<FallingBrick> projectionOf(const core::GameState& state)
{
    const FallingBrick& brick = state.fallingBrick;
    if (brick.isUnspawned()) return std::nullopt;

    FallingBrick dropped = brick.fastFallen(state.grid);
    if (dropped.y() == brick.y()) return std::nullopt;
    return dropped;
}

RenderModel buildRenderModel(const core::GameState& state, bool showProjection)
{
    RenderModel model;
    model.phase = state.phase;
    model.queue = state.queue;
    model.score = state.score;

    for (int y = 0; y < GridHeight; ++y) {
        const bool highlighted = isRowHighlighted(state, y);
        for (int x = 0; x < GridWidth; ++x) {
            const core::Cell cell = state.grid.cell(x, y);
            if (!cell) continue;
            model.cells[y][x] = RenderCell{
                highlighted ? CellKind::Animated : CellKind::Settled, cell};
        }
    }

    if (showProjection) {
        if (auto projection = projectionOf(state)) {
            overlayBrick(model, *projection, CellKind::Projection);
        }
    }

    if (!state.fallingBrick.isUnspawned()) {
        overlayBrick(model, state.fallingBrick, CellKind::Falling);
    }

    return model;
}

std::string scoreText(std::uint64_t score)
{
    return "Score: " + std::to_string(score);
}

const char* phaseName(core::GamePhase phase)
{
    switch (phase) {
    case core::GamePhase::Unstarted:  return "Unstarted";
    case core::GamePhase::InProgress: return "In progress";
    case core::GamePhase::Over:       return "Game over";
    }
    assert(false && "phaseName: unexpected phase");
    return "";
}

} // namespace brickfall::view
