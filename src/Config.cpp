#include "Config.h"

#include <algorithm>
#include <cctype>

#include "Log.h"

using namespace std;

static int parsePositive(const string &key, const string &value) {
    bool digitsOnly = !value.empty() && value.size() <= 9 &&
                      all_of(value.begin(), value.end(),
                             [](unsigned char ch) { return isdigit(ch) != 0; });
    if (!digitsOnly || stoi(value) == 0)
        throw ConfigError("'" + key + "' expects a positive number, got '" + value + "'.");
    return stoi(value);
}

// Parse a list like "2,3,3,4,5"
static vector<int> parseShips(const string &list) {
    vector<int> ships;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == string::npos) comma = list.size();
        ships.push_back(parsePositive("ships", list.substr(start, comma - start)));
        start = comma + 1;
    }
    return ships;
}

static bool parseFlag(const string &key, const string &value) {
    if (value == "1" || value == "true" || value == "on") return true;
    if (value == "0" || value == "false" || value == "off") return false;
    throw ConfigError("'" + key + "' expects 1 or 0, got '" + value + "'.");
}

GameConfig parseConfig(const vector<string> &args) {
    GameConfig config;

    for (const auto &arg : args) {
        size_t eq = arg.find('=');
        if (eq == string::npos) {
            logsys::get()->warn("Ignoring argument '{}', expected key=value", arg);
            continue;
        }
        string k = arg.substr(0, eq), v = arg.substr(eq + 1);
        if (k == "width") config.width = parsePositive(k, v);
        else if (k == "height") config.height = parsePositive(k, v);
        else if (k == "ships") config.ships = parseShips(v);
        else if (k == "log") {
            bool ok = false;
            logsys::parse_level(v, ok);
            if (!ok) throw ConfigError("Unknown log level '" + v + "'.");
            config.logLevel = v;
        }
        else if (k == "color") config.colour = parseFlag(k, v);
        else logsys::get()->warn("Ignoring unknown option '{}'", k);
    }

    const size_t longest = max(config.width, config.height);
    for (int ship : config.ships) {
        if (static_cast<size_t>(ship) > longest)
            throw ConfigError("Ship of length " + to_string(ship) + " doesn't fit on the board.");
    }
    return config;
}

GameConfig parseConfig(int argc, char **argv) {
    vector<string> args;
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);
    return parseConfig(args);
}
