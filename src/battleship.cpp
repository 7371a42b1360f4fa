#include "battleship.h"

#include <iterator>
#include <sstream>

using namespace std;

Axis opposite(Axis axis) {
    return axis == Axis::Row ? Axis::Column : Axis::Row;
}

bool canContainShip(ShotStatus status) {
    switch (status) {
        case ShotStatus::Untested:
        case ShotStatus::Hit:
            return true;
        case ShotStatus::Miss:
        case ShotStatus::Sunk:
            return false;
    }
    return false;
}

size_t Coordinate::axisIndex(Axis axis) const {
    return axis == Axis::Row ? row : column;
}

void Coordinate::setAxisIndex(Axis axis, size_t index) {
    if (axis == Axis::Row) row = index;
    else column = index;
}

string Coordinate::printable() const {
    ostringstream oss;
    oss << "[" << column + 1 << ", " << row + 1 << "]";
    return oss.str();
}

Coordinate Coordinate::fromUser(size_t column, size_t row) {
    if (column == 0 || row == 0)
        throw GameError("Coordinates start at 1.");
    Coordinate coord;
    coord.row = row - 1;
    coord.column = column - 1;
    return coord;
}

bool operator==(const Coordinate &a, const Coordinate &b) {
    return a.row == b.row && a.column == b.column;
}

bool operator!=(const Coordinate &a, const Coordinate &b) {
    return !(a == b);
}

string printable(const ShipLocation &location) {
    string out;
    for (const auto &coord : location) out += coord.printable();
    return out;
}

vector<int> defaultShips() {
    return vector<int>(begin(DEFAULT_SHIPS), end(DEFAULT_SHIPS));
}
