#include <catch2/catch.hpp>

#include <stdexcept>

#include "controller/GameConfig.hpp"

using brickfall::controller::GameConfig;
using brickfall::controller::parseArgs;
using brickfall::controller::usage;

TEST_CASE("parseArgs defaults", "[config]")
{
    const char* argv[] = {"brickfall"};
    const GameConfig config = parseArgs(1, argv);

    REQUIRE(config.ticksPerSecond == 7.5);
    REQUIRE_FALSE(config.seed.has_value());
    REQUIRE(config.windowWidth == 900);
    REQUIRE(config.windowHeight == 700);
    REQUIRE(config.showProjection);
    REQUIRE_FALSE(config.verbose);
    REQUIRE_FALSE(config.showHelp);
}

TEST_CASE("parseArgs reads every flag", "[config]")
{
    const char* argv[] = {"brickfall", "--seed", "42", "--tps", "12.5", "--window", "1024x768",
                          "--no-projection", "-v"};
    const GameConfig config = parseArgs(9, argv);

    REQUIRE(config.seed == 42u);
    REQUIRE(config.ticksPerSecond == 12.5);
    REQUIRE(config.windowWidth == 1024);
    REQUIRE(config.windowHeight == 768);
    REQUIRE_FALSE(config.showProjection);
    REQUIRE(config.verbose);
}

TEST_CASE("parseArgs recognises help", "[config]")
{
    const char* argv[] = {"brickfall", "--help"};
    REQUIRE(parseArgs(2, argv).showHelp);
    REQUIRE(usage("brickfall").find("--seed") != std::string::npos);
}

TEST_CASE("parseTickCount reads the console tick command", "[config]")
{
    using brickfall::controller::MaxTicksPerCommand;
    using brickfall::controller::parseTickCount;

    REQUIRE(parseTickCount(" 5") == 5);
    REQUIRE(parseTickCount("1") == 1);

    // Huge counts are clamped instead of queueing billions of ticks
    REQUIRE(parseTickCount(" 2000000000") == MaxTicksPerCommand);
    REQUIRE(parseTickCount("99999999999999") == MaxTicksPerCommand);
    REQUIRE(MaxTicksPerCommand == 200);

    REQUIRE_FALSE(parseTickCount("").has_value());
    REQUIRE_FALSE(parseTickCount(" 0").has_value());
    REQUIRE_FALSE(parseTickCount(" -4").has_value());
    REQUIRE_FALSE(parseTickCount(" 3x").has_value());
}

TEST_CASE("parseArgs rejects bad input", "[config]")
{
    SECTION("unknown flag") {
        const char* argv[] = {"brickfall", "--turbo"};
        REQUIRE_THROWS_AS(parseArgs(2, argv), std::invalid_argument);
    }
    SECTION("missing value") {
        const char* argv[] = {"brickfall", "--seed"};
        REQUIRE_THROWS_AS(parseArgs(2, argv), std::invalid_argument);
    }
    SECTION("negative seed") {
        const char* argv[] = {"brickfall", "--seed", "-3"};
        REQUIRE_THROWS_AS(parseArgs(3, argv), std::invalid_argument);
    }
    SECTION("non-positive tick rate") {
        const char* argv[] = {"brickfall", "--tps", "0"};
        REQUIRE_THROWS_AS(parseArgs(3, argv), std::invalid_argument);
    }
    SECTION("trailing garbage in a number") {
        const char* argv[] = {"brickfall", "--tps", "7.5x"};
        REQUIRE_THROWS_AS(parseArgs(3, argv), std::invalid_argument);
    }
    SECTION("window too small") {
        const char* argv[] = {"brickfall", "--window", "200x100"};
        REQUIRE_THROWS_AS(parseArgs(3, argv), std::invalid_argument);
    }
    SECTION("malformed window") {
        const char* argv[] = {"brickfall", "--window", "800-600"};
        REQUIRE_THROWS_AS(parseArgs(3, argv), std::invalid_argument);
    }
}
