#include "controller/GameController.hpp"
#include "core/Reducer.hpp"

#include <stdexcept>
#include <utility>

namespace brickfall::controller {

GameController::GameController(core::IBrickSource& source, double ticksPerSecond)
    : source_{source}
    , state_{core::GameState::initial(source)}
    , tickInterval_{0}
{
    if (!(ticksPerSecond > 0.0)) {
        throw std::invalid_argument("GameController: ticks per second must be positive");
    }
    tickInterval_ = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::duration<double>(1.0 / ticksPerSecond));
    if (tickInterval_.count() <= 0) {
        throw std::invalid_argument("GameController: ticks per second too large");
    }
}

void GameController::handleAction(core::Action action)
{
    // Restarting also restarts the clock so the first tick is a full interval away
    if (action == core::Action::StartGame) {
        resetTiming();
    }
    queue_.push(action);
}

void GameController::update(Duration elapsed)
{
    if (state_.phase == core::GamePhase::InProgress) {
        accumulated_ += elapsed;

        // If a lot of time passed (lag), we might need several ticks
        while (accumulated_ >= tickInterval_) {
            queue_.push(core::Action::TickClock);
            accumulated_ -= tickInterval_;
        }
    }

    processPending();
}

std::size_t GameController::processPending()
{
    const auto actions = queue_.drain();
    for (core::Action action : actions) {
        state_ = core::apply(state_, action, source_);
        if (listener_) {
            listener_(state_);
        }
    }
    return actions.size();
}

void GameController::setStateListener(StateListener listener)
{
    listener_ = std::move(listener);
}

void GameController::resetTiming()
{
    accumulated_ = std::chrono::microseconds{0};
}

} // namespace brickfall::controller
