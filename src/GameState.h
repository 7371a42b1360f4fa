#ifndef SALVO_GAMESTATE_H
#define SALVO_GAMESTATE_H

#include <cstddef>
#include <functional>
#include <vector>

#include "Action.h"
#include "Grid.h"
#include "HeatMap.h"
#include "battleship.h"

// Picks one of several places a sunk ship could lie in; returns its index
typedef std::function<std::size_t(const std::vector<ShipLocation> &)> ShipLocationChooser;

// Owns everything known about the opponent's board. Every successful action
// refreshes the heat field and the recommended moves.
class GameState {
public:
    GameState(std::size_t width, std::size_t height, const std::vector<int> &ships,
              ShipLocationChooser chooser = ShipLocationChooser());

    // Applies a fully resolved action. Undo executes the opposite of the most
    // recent history entry and removes it. Nothing changes when this throws.
    void takeAction(const Action &action);

    const std::vector<Coordinate> &topMoves() const { return topMoves_; }
    const Grid<float> &heatField() const { return heat_; }
    const Grid<ShotStatus> &shots() const { return shots_; }
    const std::vector<int> &ships() const { return ships_; }
    const std::vector<Action> &history() const { return history_; }
    const std::vector<HeatWarning> &warnings() const { return warnings_; }

    bool isGameOver() const { return ships_.empty(); }

    Action lastAction() const;
    // Most recent history entry of the same kind as `pattern`, arguments ignored
    Action lastMatchingAction(const Action &pattern) const;

    // Every run of shipLength consecutive hits, rows first, then columns
    std::vector<ShipLocation> possibleShipLocations(int shipLength) const;

    void setShipLocationChooser(ShipLocationChooser chooser) { chooser_ = chooser; }

private:
    Action execute(const Action &action);
    Action sinkShip(const Action &action);
    void unsinkShip(const Action &action);
    ShipLocation chooseShipLocation(int shipLength) const;
    void update();

    Grid<ShotStatus> shots_;
    std::vector<int> ships_;
    Grid<float> heat_;
    std::vector<Coordinate> topMoves_;
    std::vector<Action> history_;
    std::vector<HeatWarning> warnings_;
    ShipLocationChooser chooser_;
};

#endif
