#include "GameState.h"

#include <algorithm>
#include <stdexcept>

#include "Log.h"

using namespace std;

GameState::GameState(size_t width, size_t height, const vector<int> &ships,
                     ShipLocationChooser chooser)
    : shots_(width, height), ships_(ships), heat_(width, height), chooser_(chooser) {
    for (int ship : ships_) {
        if (ship <= 0) throw invalid_argument("Ship lengths must be positive.");
    }
    update();
}

void GameState::takeAction(const Action &action) {
    Action toRun = action;
    bool wasUndo = false;

    if (action.kind() == Action::Undo) {
        toRun = lastAction().opposite();
        wasUndo = true;
    }

    if (!toRun.hasKnownArgs())
        throw logic_error("Actions with unknown arguments cannot be taken.");

    Action executed = execute(toRun);

    if (wasUndo) {
        logsys::get()->info("Undid '{}'", history_.back().name());
        history_.pop_back();
    } else if (!history_.empty() && history_.back().opposite() == executed) {
        // An explicit inverse of the last action cancels it out
        history_.pop_back();
    } else {
        history_.push_back(executed);
    }

    update();
}

Action GameState::execute(const Action &action) {
    switch (action.kind()) {
        case Action::Fire:
            shots_.setValue(action.coordinate().value, ShotStatus::Miss);
            break;
        case Action::Unfire:
            shots_.setValue(action.coordinate().value, ShotStatus::Untested);
            break;
        case Action::Hit:
            shots_.setValue(action.coordinate().value, ShotStatus::Hit);
            break;
        case Action::Sink:
            return sinkShip(action);
        case Action::Unsink:
            unsinkShip(action);
            break;
        case Action::Undo:
            throw logic_error("Undo is converted before it is executed.");
    }
    logsys::get()->debug("Executed {}", action.successMessage());
    return action;
}

/**
 * @brief Removes a ship from the roster and marks where it was as sunk
 *
 * The ship must lie on a run of hits of its exact length. When several runs
 * qualify the chooser decides. A sink that already knows its cells (the redo
 * of an unsink) reuses them. Everything is checked before the board or the
 * roster change.
 */
Action GameState::sinkShip(const Action &action) {
    const int shipLength = action.shipLength().value;

    auto ship = find(ships_.begin(), ships_.end(), shipLength);
    if (ship == ships_.end()) throw GameError("Ship not found.");

    ShipLocation location = action.sunkCells();
    if (location.empty()) {
        location = chooseShipLocation(shipLength);
    } else {
        for (const auto &coord : location) {
            if (shots_.getValue(coord) != ShotStatus::Hit)
                throw GameError("Ship doesn't fit existing hits.");
        }
    }

    ships_.erase(ship);
    for (const auto &coord : location) shots_.setValue(coord, ShotStatus::Sunk);

    logsys::get()->debug("Sunk ship of length {} at {}", shipLength, printable(location));
    return action.withSunkCells(location);
}

ShipLocation GameState::chooseShipLocation(int shipLength) const {
    vector<ShipLocation> locations = possibleShipLocations(shipLength);
    if (locations.empty()) throw GameError("Ship doesn't fit existing hits.");
    if (locations.size() == 1) return locations.front();

    if (!chooser_) throw logic_error("No one to ask where the ship was sunk.");
    size_t index = chooser_(locations);
    if (index >= locations.size()) throw out_of_range("Chosen ship location does not exist.");
    return locations[index];
}

void GameState::unsinkShip(const Action &action) {
    const int shipLength = action.shipLength().value;
    if (shipLength <= 0) throw GameError("Ship lengths must be positive.");

    // Bounds-check everything before touching the board
    for (const auto &coord : action.sunkCells()) shots_.getValue(coord);

    ships_.push_back(shipLength);
    for (const auto &coord : action.sunkCells()) {
        if (shots_.getValue(coord) == ShotStatus::Sunk) shots_.setValue(coord, ShotStatus::Hit);
    }
}

Action GameState::lastAction() const {
    if (history_.empty()) throw GameError("No more actions to undo.");
    return history_.back();
}

Action GameState::lastMatchingAction(const Action &pattern) const {
    if (pattern.kind() == Action::Undo)
        throw logic_error("Undo is never stored in the action history.");

    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->sameKind(pattern)) return *it;
    }
    throw GameError("Could not find last instance of action in history.");
}

vector<ShipLocation> GameState::possibleShipLocations(int shipLength) const {
    vector<ShipLocation> locations;
    if (shipLength <= 0) return locations;
    const size_t len = static_cast<size_t>(shipLength);

    for (Axis axis : {Axis::Row, Axis::Column}) {
        for (size_t index = 0; index < shots_.linesInAxis(axis); ++index) {
            vector<ShotStatus> line = shots_.getLine(axis, index);
            if (line.size() < len) continue;

            for (size_t start = 0; start + len <= line.size(); ++start) {
                bool allHit = all_of(line.begin() + start, line.begin() + start + len,
                                     [](ShotStatus s) { return s == ShotStatus::Hit; });
                if (!allHit) continue;

                ShipLocation location;
                for (size_t offset = 0; offset < len; ++offset) {
                    Coordinate coord;
                    coord.setAxisIndex(axis, index);
                    coord.setAxisIndex(opposite(axis), start + offset);
                    location.push_back(coord);
                }
                // A single cell shows up once per axis
                if (find(locations.begin(), locations.end(), location) == locations.end())
                    locations.push_back(location);
            }
        }
    }
    return locations;
}

void GameState::update() {
    HeatResult result = genHeatField(shots_, ships_);
    heat_ = result.heat;
    warnings_ = result.warnings;

    for (const auto &warning : warnings_)
        logsys::get()->warn("{} Something is wrong. Continuing regardless.", warning.message());

    if (isGameOver()) topMoves_.clear();
    else topMoves_ = genTopMoves(heat_, shots_);
}
