#include "gui_sdl/Application.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

namespace brickfall::gui_sdl {

Application::Application() = default;

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, int width, int height) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "[sdl] SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    m_window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        width, height,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );
    if (!m_window) {
        std::fprintf(stderr, "[sdl] SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_SetWindowMinimumSize(m_window, 320, 480);

    m_renderer = SDL_CreateRenderer(
        m_window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC
    );
    if (!m_renderer) {
        std::fprintf(stderr, "[sdl] SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr; // no layout file next to the binary

    if (!ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer)
        || !ImGui_ImplSDLRenderer2_Init(m_renderer)) {
        std::fprintf(stderr, "[sdl] ImGui backend initialisation failed\n");
        return false;
    }
    m_imguiReady = true;

    m_running = true;
    return true;
}

void Application::shutdown() {
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        m_imguiReady = false;
    }
    if (ImGui::GetCurrentContext()) {
        ImGui::DestroyContext();
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    if (SDL_WasInit(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        SDL_Quit();
    }
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    m_screen = std::move(screen);
}

void Application::getWindowSize(int& w, int& h) const {
    w = 0; h = 0;
    if (m_window) SDL_GetWindowSize(m_window, &w, &h);
}

void Application::beginFrame() {
    // Clear first so the screen can draw SDL shapes and ImGui overlays on top
    SDL_SetRenderDrawColor(m_renderer, 18, 18, 24, 255);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void Application::endFrame() {
    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    SDL_Event e;
    while (m_running) {
        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);

            if (e.type == SDL_QUIT) {
                m_running = false;
            }
            if (m_screen) {
                m_screen->handleEvent(*this, e);
            }
        }

        const auto now = clock::now();
        const float dt = std::chrono::duration<float>(now - last).count();
        last = now;

        if (m_screen && m_running) {
            m_screen->update(*this, dt);
        }

        beginFrame();
        if (m_screen) {
            m_screen->render(*this);
        }
        endFrame();
    }

    return 0;
}

} // namespace brickfall::gui_sdl
