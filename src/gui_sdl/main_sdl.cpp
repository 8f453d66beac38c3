#include "gui_sdl/Application.hpp"
#include "gui_sdl/GameScreen.hpp"
#include "controller/GameConfig.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>

int main(int argc, char** argv) {
    using namespace brickfall;

    controller::GameConfig config;
    try {
        config = controller::parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "[brickfall] %s\n%s", e.what(), controller::usage(argv[0]).c_str());
        return 1;
    }
    if (config.showHelp) {
        std::printf("%s", controller::usage(argv[0]).c_str());
        return 0;
    }

    gui_sdl::Application app;
    if (!app.init("Brickfall", config.windowWidth, config.windowHeight)) {
        return 1;
    }

    app.setScreen(std::make_unique<gui_sdl::GameScreen>(config));
    return app.run();
}
