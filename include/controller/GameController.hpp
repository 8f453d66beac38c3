#pragma once

#include "core/GameState.hpp"
#include "core/BrickSource.hpp"
#include "core/Types.hpp"
#include "controller/ActionQueue.hpp"
#include <chrono>
#include <cstddef>
#include <functional>

namespace brickfall::controller {

class GameController {
public:
    using Duration = std::chrono::milliseconds;
    using StateListener = std::function<void(const core::GameState&)>;

    /// Controller does not own the brick source; caller keeps it alive.
    explicit GameController(core::IBrickSource& source,
                            double ticksPerSecond = core::DefaultTicksPerSecond);

    const core::GameState& state() const noexcept { return state_; }

    // Called by UI or main loop when some input happens.
    // The action is queued and applied by the next processPending().
    void handleAction(core::Action action);

    // Called periodically with elapsed time since last call.
    // Queues one TickClock per whole tick interval, then processes the queue.
    void update(Duration elapsed);

    // Folds every queued action through the reducer, in order.
    // Returns the number of actions applied.
    std::size_t processPending();

    // Called after every applied action with the new state.
    void setStateListener(StateListener listener);

    // Reset timing accumulator (e.g. when a game is started)
    void resetTiming();

    std::chrono::microseconds tickInterval() const noexcept { return tickInterval_; }

private:
    core::IBrickSource& source_;
    core::GameState state_;
    ActionQueue queue_;
    StateListener listener_;

    std::chrono::microseconds tickInterval_;
    std::chrono::microseconds accumulated_{0};
};

} // namespace brickfall::controller
