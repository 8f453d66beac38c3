#pragma once

#include "Types.hpp"
#include "GameState.hpp"
#include "BrickSource.hpp"

namespace brickfall::core {

// Pure reducer: the only way a GameState changes.
// One action in, one new state out; the input state is never modified.
// Actions that do not apply to the current phase return the state unchanged.
GameState apply(const GameState& state, Action action, IBrickSource& source);

// Fresh in-progress session (discards everything in `state`'s lineage)
GameState startGame(IBrickSource& source);

// Gravity step, lock-in, dequeue and row-clear animation
GameState tickClock(const GameState& state, IBrickSource& source);

} // namespace brickfall::core
