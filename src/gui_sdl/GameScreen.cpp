#include "gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "core/BrickShape.hpp"

namespace brickfall::gui_sdl {

namespace {

struct Rgb {
    std::uint8_t r, g, b;
};

Rgb colorForBrick(core::BrickType type)
{
    using core::BrickType;
    switch (type) {
        case BrickType::I: return {  0, 255, 255};
        case BrickType::O: return {255, 255,   0};
        case BrickType::T: return {160,  32, 240};
        case BrickType::J: return {  0,   0, 255};
        case BrickType::L: return {255, 165,   0};
        case BrickType::S: return {  0, 255,   0};
        case BrickType::Z: return {255,   0,   0};
    }
    return {200, 200, 200};
}

ImU32 imColorForBrick(core::BrickType type)
{
    const Rgb c = colorForBrick(type);
    return IM_COL32(c.r, c.g, c.b, 255);
}

} // namespace

GameScreen::GameScreen(const controller::GameConfig& config)
    : config_(config)
    , source_(config.seed)
    , controller_(source_, config.ticksPerSecond)
{
    controller_.setStateListener([this](const core::GameState& state) {
        onStateChanged(state);
    });
}

void GameScreen::onStateChanged(const core::GameState& state)
{
    if (state.phase != lastPhase_) {
        if (state.phase == core::GamePhase::InProgress) {
            std::fprintf(stderr, "[brickfall] game started\n");
        } else if (state.phase == core::GamePhase::Over) {
            std::fprintf(stderr, "[brickfall] game over, score %llu\n",
                         static_cast<unsigned long long>(state.score));
        }
        lastPhase_ = state.phase;
    }

    if (config_.verbose && state.score > lastScore_) {
        std::fprintf(stderr, "[brickfall] %d row(s) complete, score %llu\n",
                     state.grid.completedRowCount(),
                     static_cast<unsigned long long>(state.score));
    }
    lastScore_ = state.score;
}

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN) return;

    // Held arrows repeat through the OS key repeat
    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
            controller_.handleAction(core::Action::Left);
            break;
        case SDLK_RIGHT:
            controller_.handleAction(core::Action::Right);
            break;
        case SDLK_UP:
            controller_.handleAction(core::Action::Up);
            break;
        case SDLK_DOWN:
            controller_.handleAction(core::Action::Down);
            break;
        case SDLK_RETURN:
            if (e.key.repeat == 0) {
                controller_.handleAction(core::Action::StartGame);
            }
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void GameScreen::update(Application&, float dtSeconds)
{
    const float ms = dtSeconds * 1000.0f + frameRemainderMs_;
    const int wholeMs = static_cast<int>(ms);
    frameRemainderMs_ = ms - static_cast<float>(wholeMs);

    controller_.update(controller::GameController::Duration{wholeMs});
}

GameScreen::Layout GameScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int margin = 20;

    const int usableW = windowW - margin * 3 - L.sideW;
    const int usableH = windowH - margin * 2;

    int cell = std::min(usableW / core::GridWidth, usableH / core::GridHeight);
    cell = std::clamp(cell, 12, 44);

    L.cell = cell;
    L.boardW = core::GridWidth * cell;
    L.boardH = core::GridHeight * cell;

    const int groupW = L.boardW + margin + L.sideW;
    L.boardX = std::max(margin, (windowW - groupW) / 2);
    L.boardY = margin + std::max(0, (usableH - L.boardH) / 2);
    L.sideX = L.boardX + L.boardW + margin;
    return L;
}

void GameScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const view::RenderModel model =
        view::buildRenderModel(controller_.state(), config_.showProjection);

    switch (model.phase) {
        case core::GamePhase::Unstarted:
            renderStartPanel(winW, winH);
            return;
        case core::GamePhase::InProgress: {
            const Layout L = computeLayout(winW, winH);
            renderBoard(app.renderer(), model, L);
            renderSidebar(model, L);
            return;
        }
        case core::GamePhase::Over:
            renderGameOverPanel(model, winW, winH);
            return;
    }
    assert(false && "GameScreen::render: unexpected phase");
}

void GameScreen::renderBoard(SDL_Renderer* renderer, const view::RenderModel& model,
                             const Layout& L) const
{
    const int x = L.boardX;
    const int y = L.boardY;
    const int cellSize = L.cell;

    SDL_SetRenderDrawColor(renderer, 12, 12, 16, 255);
    SDL_Rect boardRect{x, y, L.boardW, L.boardH};
    SDL_RenderFillRect(renderer, &boardRect);

    SDL_SetRenderDrawColor(renderer, 40, 40, 55, 255);
    for (int r = 0; r <= core::GridHeight; ++r) {
        SDL_RenderDrawLine(renderer, x, y + r * cellSize, x + L.boardW, y + r * cellSize);
    }
    for (int c = 0; c <= core::GridWidth; ++c) {
        SDL_RenderDrawLine(renderer, x + c * cellSize, y, x + c * cellSize, y + L.boardH);
    }

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    for (int r = 0; r < core::GridHeight; ++r) {
        for (int c = 0; c < core::GridWidth; ++c) {
            const view::RenderCell& cell = model.cells[r][c];
            if (cell.kind == view::CellKind::Empty || !cell.type) continue;

            const Rgb col = colorForBrick(*cell.type);
            SDL_Rect rct{x + c * cellSize + 1, y + r * cellSize + 1, cellSize - 2, cellSize - 2};

            switch (cell.kind) {
                case view::CellKind::Settled:
                case view::CellKind::Falling:
                    SDL_SetRenderDrawColor(renderer, col.r, col.g, col.b, 255);
                    SDL_RenderFillRect(renderer, &rct);
                    break;
                case view::CellKind::Animated:
                    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
                    SDL_RenderFillRect(renderer, &rct);
                    break;
                case view::CellKind::Projection:
                    SDL_SetRenderDrawColor(renderer, col.r, col.g, col.b, 90);
                    SDL_RenderDrawRect(renderer, &rct);
                    break;
                case view::CellKind::Empty:
                    break;
            }
        }
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

void GameScreen::renderSidebar(const view::RenderModel& model, const Layout& L) const
{
    ImGui::SetNextWindowPos(ImVec2((float)L.sideX, (float)L.boardY), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)L.sideW, 0.0f), ImGuiCond_Always);

    const ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_AlwaysAutoResize;

    ImGui::Begin("Brickfall", nullptr, flags);
    ImGui::TextUnformatted(view::scoreText(model.score).c_str());
    ImGui::Separator();
    ImGui::TextUnformatted("Next");

    // Each queued brick in its canonical shape, 4x4 slot per brick
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const float cell = 14.0f;
    const float slot = cell * core::BrickShape::MaxSize + 8.0f;
    for (core::BrickType type : model.queue) {
        const ImVec2 origin = ImGui::GetCursorScreenPos();
        const core::BrickShape& shape = core::canonicalShape(type);
        for (int r = 0; r < shape.size(); ++r) {
            for (int c = 0; c < shape.size(); ++c) {
                if (!shape.at(r, c)) continue;
                const ImVec2 p0(origin.x + c * cell, origin.y + r * cell);
                const ImVec2 p1(p0.x + cell - 2.0f, p0.y + cell - 2.0f);
                dl->AddRectFilled(p0, p1, imColorForBrick(type));
            }
        }
        ImGui::Dummy(ImVec2(slot, slot));
    }

    ImGui::Separator();
    ImGui::TextUnformatted("Left/Right: move");
    ImGui::TextUnformatted("Up: rotate");
    ImGui::TextUnformatted("Down: hard drop");
    ImGui::TextUnformatted("Esc: quit");
    ImGui::End();
}

void GameScreen::renderStartPanel(int windowW, int windowH)
{
    ImGui::SetNextWindowPos(ImVec2(windowW * 0.5f, windowH * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(320, 140), ImGuiCond_Always);

    const ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("Brickfall", nullptr, flags);
    ImGui::TextUnformatted("Arrow keys to play.");
    ImGui::Separator();
    if (ImGui::Button("Start Game", ImVec2(-1, 44))) {
        controller_.handleAction(core::Action::StartGame);
    }
    ImGui::End();
}

void GameScreen::renderGameOverPanel(const view::RenderModel& model, int windowW, int windowH)
{
    ImGui::SetNextWindowPos(ImVec2(windowW * 0.5f, windowH * 0.5f), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(320, 160), ImGuiCond_Always);

    const ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoMove;

    ImGui::Begin("Game Over", nullptr, flags);
    ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "GAME OVER");
    ImGui::TextUnformatted(view::scoreText(model.score).c_str());
    ImGui::Separator();
    if (ImGui::Button("Restart", ImVec2(-1, 44))) {
        controller_.handleAction(core::Action::StartGame);
    }
    ImGui::End();
}

} // namespace brickfall::gui_sdl
