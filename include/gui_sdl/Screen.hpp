#pragma once

#include <SDL.h>

namespace brickfall::gui_sdl {

class Application;

// A full-window view driven by the application loop
class Screen {
public:
    virtual ~Screen() = default;

    // Handle SDL events (keyboard/mouse/window)
    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Advance the game by the frame time
    virtual void update(Application& app, float dtSeconds) = 0;

    // Draw with SDL, then ImGui on top
    virtual void render(Application& app) = 0;
};

} // namespace brickfall::gui_sdl
