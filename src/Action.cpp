#include "Action.h"

#include <sstream>
#include <stdexcept>

using namespace std;

Action::Action(Kind kind, const Argument<Coordinate> &coord) : kind_(kind), coordinate_(coord) {}

Action::Action(Kind kind, const Argument<int> &shipLength) : kind_(kind), shipLength_(shipLength) {}

Action Action::fire() { return Action(Fire, Argument<Coordinate>()); }
Action Action::fire(const Coordinate &coord) { return Action(Fire, Argument<Coordinate>::of(coord)); }
Action Action::hit() { return Action(Hit, Argument<Coordinate>()); }
Action Action::hit(const Coordinate &coord) { return Action(Hit, Argument<Coordinate>::of(coord)); }
Action Action::sink() { return Action(Sink, Argument<int>()); }
Action Action::sink(int shipLength) { return Action(Sink, Argument<int>::of(shipLength)); }
Action Action::unfire() { return Action(Unfire, Argument<Coordinate>()); }
Action Action::unfire(const Coordinate &coord) { return Action(Unfire, Argument<Coordinate>::of(coord)); }
Action Action::unsink() { return Action(Unsink, Argument<int>()); }
Action Action::unsink(int shipLength) { return Action(Unsink, Argument<int>::of(shipLength)); }
Action Action::undo() { return Action(Undo); }

vector<Action> Action::allActions() {
    return {fire(), hit(), sink(), unfire(), unsink(), undo()};
}

Action Action::withSunkCells(const ShipLocation &cells) const {
    Action copy(*this);
    copy.sunkCells_ = cells;
    return copy;
}

bool Action::isCoordinateAction() const {
    return kind_ == Fire || kind_ == Hit || kind_ == Unfire;
}

bool Action::isLengthAction() const {
    return kind_ == Sink || kind_ == Unsink;
}

string Action::name() const {
    switch (kind_) {
        case Fire:   return "fire";
        case Hit:    return "hit";
        case Sink:   return "sink";
        case Unfire: return "unfire";
        case Unsink: return "unsink";
        case Undo:   return "undo";
    }
    return "";
}

Action Action::opposite() const {
    Action result(*this);
    switch (kind_) {
        case Fire:
        case Hit:
            result.kind_ = Unfire;
            break;
        case Unfire:
            result.kind_ = Fire;
            break;
        case Sink:
            result.kind_ = Unsink;
            break;
        case Unsink:
            result.kind_ = Sink;
            break;
        case Undo:
            throw logic_error("There exists no opposite of 'undo'.");
    }
    return result;
}

int Action::expectedArgCount() const {
    if (isCoordinateAction()) return 2;
    if (isLengthAction()) return 1;
    return 0;
}

// The ship length of a sink can't be worked out from the board
bool Action::canInferArgs() const {
    return kind_ != Sink;
}

bool Action::hasKnownArgs() const {
    if (isCoordinateAction()) return coordinate_.known;
    if (isLengthAction()) return shipLength_.known;
    return true;
}

string Action::syntaxHelp() const {
    switch (kind_) {
        case Fire:
            return "'fire <column> <row>' [1-index] Fires at the specified coordinate.\n"
                   "\tDefault: Executes most recent recommendation.";
        case Hit:
            return "'hit <column> <row>' [1-index] Marks the specified coordinate as hit.\n"
                   "\tDefault: Marks the most recently fired at coordinate as hit.";
        case Sink:
            return "'sink <ship length>' Removes one ship of the specified length from the list.\n"
                   "\tThe length cannot be inferred.";
        case Unfire:
            return "'unfire <column> <row>' [1-index] Removes specified firing marker.\n"
                   "\tDefault: Undoes most recent fire command.";
        case Unsink:
            return "'unsink <ship length>' Adds one ship of the specified length to the list.\n"
                   "\tDefault: Undoes the most recent sink command.";
        case Undo:
            return "'undo' Undoes the most recent action.";
    }
    return "";
}

string Action::successMessage() const {
    if (kind_ == Undo)
        throw logic_error("An undo reports the message of the action it executes.");
    if (!hasKnownArgs())
        throw logic_error("Actions with unknown arguments are never executed.");

    ostringstream oss;
    switch (kind_) {
        case Fire:   oss << "Fired at " << coordinate_.value.printable() << "."; break;
        case Hit:    oss << "Set hit marker at " << coordinate_.value.printable() << "."; break;
        case Sink:   oss << "Sunk a ship of length " << shipLength_.value << "."; break;
        case Unfire: oss << "Removed fire marker at " << coordinate_.value.printable() << "."; break;
        case Unsink: oss << "Added a ship of length " << shipLength_.value << " to the roster."; break;
        case Undo:   break;
    }
    return oss.str();
}

bool operator==(const Action &a, const Action &b) {
    return a.kind() == b.kind() && a.coordinate() == b.coordinate() &&
           a.shipLength() == b.shipLength() && a.sunkCells() == b.sunkCells();
}

bool operator!=(const Action &a, const Action &b) {
    return !(a == b);
}
