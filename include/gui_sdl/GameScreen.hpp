#pragma once

#include "gui_sdl/Screen.hpp"
#include "core/BrickSource.hpp"
#include "core/Types.hpp"
#include "controller/GameConfig.hpp"
#include "controller/GameController.hpp"
#include "view/RenderModel.hpp"

#include <cstdint>

namespace brickfall::gui_sdl {

// The single game view: start panel, board + sidebar, or game-over panel,
// depending on the phase of the current state.
class GameScreen final : public Screen {
public:
    explicit GameScreen(const controller::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, float dtSeconds) override;
    void render(Application& app) override;

private:
    struct Layout {
        int cell = 28;

        int boardX = 40;
        int boardY = 40;
        int boardW = 0;
        int boardH = 0;

        int sideX = 0;
        int sideW = 220;
    };

    Layout computeLayout(int windowW, int windowH) const;

    void renderBoard(SDL_Renderer* renderer, const view::RenderModel& model, const Layout& L) const;
    void renderSidebar(const view::RenderModel& model, const Layout& L) const;
    void renderStartPanel(int windowW, int windowH);
    void renderGameOverPanel(const view::RenderModel& model, int windowW, int windowH);

    void onStateChanged(const core::GameState& state);

private:
    controller::GameConfig config_;
    core::RandomBrickSource source_;
    controller::GameController controller_;

    core::GamePhase lastPhase_{core::GamePhase::Unstarted};
    std::uint64_t lastScore_{0};
    float frameRemainderMs_{0.0f};
};

} // namespace brickfall::gui_sdl
