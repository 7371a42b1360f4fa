// tests/test_config.cpp
//
// Coverage for src/Config.{h,cpp}: start-up options given as key=value pairs.

#include <doctest/doctest.h>

#include "Config.h"

#include <string>
#include <vector>

TEST_CASE("No options gives the classic 9x7 game")
{
    GameConfig config = parseConfig(std::vector<std::string>{});
    CHECK(config.width == 9);
    CHECK(config.height == 7);
    CHECK(config.ships == std::vector<int>{2, 3, 3, 4, 5});
    CHECK(config.logLevel == "warn");
    CHECK(config.colour);
}

TEST_CASE("Every option is read")
{
    GameConfig config = parseConfig({"width=10", "height=8", "ships=2,3", "log=debug", "color=0"});
    CHECK(config.width == 10);
    CHECK(config.height == 8);
    CHECK(config.ships == std::vector<int>{2, 3});
    CHECK(config.logLevel == "debug");
    CHECK_FALSE(config.colour);

    CHECK(parseConfig({"color=on"}).colour);
    CHECK_FALSE(parseConfig({"color=false"}).colour);
}

TEST_CASE("Unknown and malformed options are skipped")
{
    GameConfig config = parseConfig({"depth=3", "verbose", "width=6"});
    CHECK(config.width == 6);
    CHECK(config.height == 7);
}

TEST_CASE("argv form skips the program name")
{
    std::string program = "salvo", width = "width=12";
    char* argv[] = {&program[0], &width[0]};
    CHECK(parseConfig(2, argv).width == 12);
}

TEST_CASE("Bad values are rejected")
{
    CHECK_THROWS_WITH_AS(parseConfig({"width=0"}), "'width' expects a positive number, got '0'.",
                         ConfigError);
    CHECK_THROWS_AS(parseConfig({"height=x"}), ConfigError);
    CHECK_THROWS_AS(parseConfig({"width=-4"}), ConfigError);
    CHECK_THROWS_AS(parseConfig({"ships=2,,3"}), ConfigError);
    CHECK_THROWS_AS(parseConfig({"ships="}), ConfigError);
    CHECK_THROWS_AS(parseConfig({"color=maybe"}), ConfigError);
    CHECK_THROWS_WITH_AS(parseConfig({"log=loud"}), "Unknown log level 'loud'.", ConfigError);
}

TEST_CASE("Ships longer than the board are rejected")
{
    CHECK_THROWS_WITH_AS(parseConfig({"ships=12"}), "Ship of length 12 doesn't fit on the board.",
                         ConfigError);
    // Only the longer side has to fit
    CHECK(parseConfig({"width=3", "height=9", "ships=9"}).ships == std::vector<int>{9});
}
