#include "BoardView.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std;

static const char RED[] = "\033[31m";
static const char GREEN[] = "\033[32m";
static const char RESET[] = "\033[0m";

string renderBoard(const GameState &state, bool colour) {
    const Grid<ShotStatus> &shots = state.shots();
    const Grid<float> &heat = state.heatField();
    const vector<Coordinate> &top = state.topMoves();

    ostringstream oss;
    oss << "Board State:\n" << fixed << setprecision(2);
    for (size_t r = 0; r < shots.height(); ++r) {
        for (size_t c = 0; c < shots.width(); ++c) {
            Coordinate coord;
            coord.row = r;
            coord.column = c;

            switch (shots.getValue(coord)) {
                case ShotStatus::Hit:  oss << HIT_MARKER; break;
                case ShotStatus::Miss: oss << MISS_MARKER; break;
                case ShotStatus::Sunk: oss << SUNK_MARKER; break;
                case ShotStatus::Untested: {
                    auto pos = find(top.begin(), top.end(), coord);
                    const char *tint = nullptr;
                    if (colour && pos != top.end()) tint = (pos == top.begin()) ? RED : GREEN;

                    if (tint) oss << tint;
                    oss << "[" << heat.getValue(coord) << "]";
                    if (tint) oss << RESET;
                    break;
                }
            }
        }
        oss << "\n";
    }
    return oss.str();
}

string renderRecommendations(const GameState &state) {
    const vector<Coordinate> &top = state.topMoves();
    if (top.empty()) return "No recommended move.\n";

    string out = "Recommended move: " + top.front().printable() + "\n";
    if (top.size() > 1) {
        out += "Alternate moves:";
        for (size_t i = 1; i < top.size(); ++i) out += top[i].printable();
        out += "\n";
    }
    return out;
}

ShipLocationChooser promptShipLocation(istream &in, ostream &out) {
    return [&in, &out](const vector<ShipLocation> &locations) -> size_t {
        out << "The ship to sink could be in multiple places. Please select one:\n";
        for (size_t i = 0; i < locations.size(); ++i)
            out << i + 1 << ": " << printable(locations[i]) << "\n";

        string line;
        while (true) {
            out << flush;
            if (!getline(in, line)) throw GameError("No ship location selected.");

            istringstream iss(line);
            size_t choice = 0;
            string rest;
            if (iss >> choice && !(iss >> rest) && choice >= 1 && choice <= locations.size())
                return choice - 1;
            out << "Invalid, please try again.\n";
        }
    };
}
