#pragma once

#include <memory>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"

namespace brickfall::gui_sdl {

// Owns the SDL window/renderer and the ImGui context, and runs the frame loop.
class Application {
public:
    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Returns false (after logging the SDL error) if any step fails
    bool init(const char* title, int width, int height);
    int run();

    void requestQuit() { m_running = false; }

    void setScreen(std::unique_ptr<Screen> screen);

    SDL_Renderer* renderer() const { return m_renderer; }

    void getWindowSize(int& w, int& h) const;

private:
    void shutdown();
    void beginFrame();
    void endFrame();

private:
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
};

} // namespace brickfall::gui_sdl
