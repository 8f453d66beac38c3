#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/BrickSource.hpp"
#include "core/GameState.hpp"
#include "core/Types.hpp"
#include "controller/GameConfig.hpp"
#include "controller/GameController.hpp"
#include "view/RenderModel.hpp"

using namespace brickfall;

namespace {

char brickLetter(core::BrickType type) {
    switch (type) {
    case core::BrickType::I: return 'I';
    case core::BrickType::L: return 'L';
    case core::BrickType::J: return 'J';
    case core::BrickType::O: return 'O';
    case core::BrickType::S: return 'S';
    case core::BrickType::Z: return 'Z';
    case core::BrickType::T: return 'T';
    }
    return '?';
}

char cellGlyph(const view::RenderCell& cell) {
    switch (cell.kind) {
    case view::CellKind::Empty:      return '.';
    case view::CellKind::Settled:    return cell.type ? brickLetter(*cell.type) : '#';
    case view::CellKind::Animated:   return '=';
    case view::CellKind::Falling:    return 'X';
    case view::CellKind::Projection: return '+';
    }
    return '?';
}

// Helper: render the current board, falling brick and queue as ASCII
void printGame(const core::GameState& game, bool showProjection) {
    const view::RenderModel model = view::buildRenderModel(game, showProjection);

    std::cout << "\n==== BRICKFALL ====\n";
    std::cout << view::scoreText(model.score)
              << " | Status: " << view::phaseName(model.phase) << '\n';

    if (model.phase == core::GamePhase::Unstarted) {
        std::cout << "Press 'n' to start a game.\n";
        return;
    }
    if (model.phase == core::GamePhase::Over) {
        std::cout << "GAME OVER. Final " << view::scoreText(model.score)
                  << ". Press 'n' to play again or 'q' to quit.\n";
        return;
    }

    std::cout << "Next:";
    for (core::BrickType type : model.queue) {
        std::cout << ' ' << brickLetter(type);
    }
    std::cout << '\n';

    // Print board with borders
    std::cout << '+' << std::string(core::GridWidth, '-') << "+\n";
    for (const auto& row : model.cells) {
        std::cout << '|';
        for (const auto& cell : row) {
            std::cout << cellGlyph(cell);
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(core::GridWidth, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, w = rotate, s = hard drop\n"
              << "  g = clock tick, t N = N clock ticks\n"
              << "  n = start, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    controller::GameConfig config;
    try {
        config = controller::parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[brickfall] " << e.what() << '\n' << controller::usage(argv[0]);
        return 1;
    }
    if (config.showHelp) {
        std::cout << controller::usage(argv[0]);
        return 0;
    }

    core::RandomBrickSource source{config.seed};
    controller::GameController game{source, config.ticksPerSecond};

    core::GamePhase lastPhase = game.state().phase;
    std::uint64_t lastScore = 0;
    game.setStateListener([&](const core::GameState& state) {
        if (state.phase != lastPhase) {
            if (state.phase == core::GamePhase::InProgress) {
                std::cerr << "[brickfall] game started\n";
            } else if (state.phase == core::GamePhase::Over) {
                std::cerr << "[brickfall] game over, " << view::scoreText(state.score) << '\n';
            }
            lastPhase = state.phase;
        }
        // Points are only ever awarded when rows complete
        if (config.verbose && state.score > lastScore) {
            std::cerr << "[brickfall] " << state.grid.completedRowCount()
                      << " row(s) complete, " << view::scoreText(state.score) << '\n';
        }
        lastScore = state.score;
    });

    std::string cmd;
    printGame(game.state(), config.showProjection);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            game.handleAction(core::Action::Left);
            break;
        case 'd': case 'D':
            game.handleAction(core::Action::Right);
            break;
        case 'w': case 'W':
            game.handleAction(core::Action::Up);
            break;
        case 's': case 'S':
            game.handleAction(core::Action::Down);
            break;
        case 'g': case 'G':
            game.handleAction(core::Action::TickClock);
            break;
        case 't': case 'T': {
            const auto ticks = controller::parseTickCount(cmd.substr(1));
            if (!ticks) {
                std::cout << "Usage: t N (0 < N, at most " << controller::MaxTicksPerCommand << ")\n";
                break;
            }
            for (int i = 0; i < *ticks; ++i) {
                game.handleAction(core::Action::TickClock);
            }
            break;
        }
        case 'n': case 'N':
            game.handleAction(core::Action::StartGame);
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        game.processPending();
        printGame(game.state(), config.showProjection);
    }

    return 0;
}
