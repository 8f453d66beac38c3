#include "controller/GameConfig.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace brickfall::controller {

namespace {

std::string requireValue(int argc, const char* const argv[], int& i, const std::string& flag)
{
    if (i + 1 >= argc) {
        throw std::invalid_argument(flag + " expects a value");
    }
    return argv[++i];
}

std::uint32_t parseSeed(const std::string& text)
{
    std::size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--seed expects a non-negative integer, got '" + text + "'");
    }
    if (used != text.size() || text[0] == '-'
        || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("--seed expects a 32-bit non-negative integer, got '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

double parseTicksPerSecond(const std::string& text)
{
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--tps expects a number, got '" + text + "'");
    }
    if (used != text.size() || !(value > 0.0) || value > 1000.0) {
        throw std::invalid_argument("--tps must be in (0, 1000], got '" + text + "'");
    }
    return value;
}

void parseWindow(const std::string& text, GameConfig& config)
{
    std::istringstream in(text);
    int w = 0;
    int h = 0;
    char sep = '\0';
    if (!(in >> w >> sep >> h) || (sep != 'x' && sep != 'X') || !in.eof()
        || w < 320 || h < 480) {
        throw std::invalid_argument("--window expects WIDTHxHEIGHT of at least 320x480, got '" + text + "'");
    }
    config.windowWidth = w;
    config.windowHeight = h;
}

} // namespace

GameConfig parseArgs(int argc, const char* const argv[])
{
    GameConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--seed") {
            config.seed = parseSeed(requireValue(argc, argv, i, arg));
        } else if (arg == "--tps") {
            config.ticksPerSecond = parseTicksPerSecond(requireValue(argc, argv, i, arg));
        } else if (arg == "--window") {
            parseWindow(requireValue(argc, argv, i, arg), config);
        } else if (arg == "--no-projection") {
            config.showProjection = false;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }

    return config;
}

std::optional<int> parseTickCount(const std::string& text)
{
    std::istringstream in(text);
    long long value = 0;
    if (!(in >> value) || value <= 0) {
        return std::nullopt;
    }
    in >> std::ws;
    if (!in.eof()) {
        return std::nullopt;
    }
    return static_cast<int>(std::min<long long>(value, MaxTicksPerCommand));
}

std::string usage(const std::string& program)
{
    return "Usage: " + program + " [options]\n"
           "  --seed N          fixed brick sequence\n"
           "  --tps X           gravity ticks per second (default 7.5)\n"
           "  --window WxH      window size, desktop front-end only (default 900x700)\n"
           "  --no-projection   do not draw the hard-drop projection\n"
           "  -v, --verbose     log row clears\n"
           "  -h, --help        show this help\n";
}

} // namespace brickfall::controller
