#include "BoardView.h"
#include "CommandLine.h"
#include "Config.h"
#include "GameState.h"
#include "Log.h"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace std;

static void showState(const GameState &state, bool colour) {
    cout << renderBoard(state, colour);
    cout << renderRecommendations(state);
}

int main(int argc, char** argv) {
    GameConfig config;
    try {
        config = parseConfig(argc, argv);
    } catch (const ConfigError &e) {
        cerr << e.what() << "\n";
        cerr << "Usage: salvo [width=9] [height=7] [ships=2,3,3,4,5] [log=warn] [color=1]\n";
        return 1;
    }

    bool levelOk = false;
    logsys::init(logsys::parse_level(config.logLevel, levelOk));
    logsys::get()->info("Board {}x{} with {} ships", config.width, config.height, config.ships.size());

    GameState state(config.width, config.height, config.ships, promptShipLocation(cin, cout));

    cout << helpText();
    showState(state, config.colour);

    string line;
    while (true) {
        cout << "Please enter a command.\n" << flush;
        if (!getline(cin, line)) break;

        try {
            cout << runCommand(line, state) << "\n";
            showState(state, config.colour);
        } catch (const GameError &e) {
            cout << e.what() << "\n";
        } catch (const out_of_range &e) {
            cout << e.what() << "\n";
        }
    }

    return 0;
}
