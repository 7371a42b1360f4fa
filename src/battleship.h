#ifndef SALVO_BATTLESHIP_H
#define SALVO_BATTLESHIP_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Default board and roster
const int DEFAULT_WIDTH  = 9;
const int DEFAULT_HEIGHT = 7;
const int DEFAULT_SHIPS[] = {2, 3, 3, 4, 5};

// Board markers used by the text view
const char HIT_MARKER[]  = "[####]";
const char MISS_MARKER[] = "[----]";
const char SUNK_MARKER[] = "[||||]";

enum class Axis { Row, Column };

Axis opposite(Axis axis);

// Per-cell knowledge about the opponent's board
enum class ShotStatus { Untested, Miss, Hit, Sunk };

// Untested and hit cells may still hold an undiscovered ship segment
bool canContainShip(ShotStatus status);

// User-correctable failure: bad command, impossible sink, empty history...
class GameError : public std::runtime_error {
public:
    explicit GameError(const std::string &what) : std::runtime_error(what) {}
};

struct Coordinate {
    std::size_t row = 0;
    std::size_t column = 0;

    std::size_t axisIndex(Axis axis) const;
    void setAxisIndex(Axis axis, std::size_t index);

    // Formatted 1-indexed, column first: "[column, row]"
    std::string printable() const;

    // Converts 1-indexed column/row input; 0 is rejected
    static Coordinate fromUser(std::size_t column, std::size_t row);
};

bool operator==(const Coordinate &a, const Coordinate &b);
bool operator!=(const Coordinate &a, const Coordinate &b);

// A run of cells a single ship occupies
typedef std::vector<Coordinate> ShipLocation;

std::string printable(const ShipLocation &location);

std::vector<int> defaultShips();

#endif
