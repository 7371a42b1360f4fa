#ifndef SALVO_CONFIG_H
#define SALVO_CONFIG_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "battleship.h"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

// Start-up options, given as key=value pairs:
//   width=9 height=7 ships=2,3,3,4,5 log=warn color=1
struct GameConfig {
    std::size_t width = DEFAULT_WIDTH;
    std::size_t height = DEFAULT_HEIGHT;
    std::vector<int> ships = defaultShips();
    std::string logLevel = "warn";
    bool colour = true;
};

GameConfig parseConfig(const std::vector<std::string> &args);
GameConfig parseConfig(int argc, char **argv);

#endif
