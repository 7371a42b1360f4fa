#ifndef SALVO_ACTION_H
#define SALVO_ACTION_H

#include <string>
#include <vector>

#include "battleship.h"

// An action argument the user may have left out
template <typename T>
struct Argument {
    bool known = false;
    T value{};

    static Argument of(const T &v) {
        Argument arg;
        arg.known = true;
        arg.value = v;
        return arg;
    }
};

template <typename T>
bool operator==(const Argument<T> &a, const Argument<T> &b) {
    return a.known == b.known && (!a.known || a.value == b.value);
}

// A player move. Fire, Hit and Unfire take a coordinate; Sink and Unsink a
// ship length; Undo takes nothing.
class Action {
public:
    enum Kind { Fire, Hit, Sink, Unfire, Unsink, Undo };

    static Action fire();
    static Action fire(const Coordinate &coord);
    static Action hit();
    static Action hit(const Coordinate &coord);
    static Action sink();
    static Action sink(int shipLength);
    static Action unfire();
    static Action unfire(const Coordinate &coord);
    static Action unsink();
    static Action unsink(int shipLength);
    static Action undo();

    // One action of each kind with unknown arguments, in declaration order
    static std::vector<Action> allActions();

    Kind kind() const { return kind_; }
    const Argument<Coordinate> &coordinate() const { return coordinate_; }
    const Argument<int> &shipLength() const { return shipLength_; }

    // Cells a sink marked as sunk; carried to its opposite so it can revert them
    const ShipLocation &sunkCells() const { return sunkCells_; }
    Action withSunkCells(const ShipLocation &cells) const;

    bool isCoordinateAction() const;
    bool isLengthAction() const;

    std::string name() const;
    Action opposite() const;
    int expectedArgCount() const;
    bool canInferArgs() const;
    bool hasKnownArgs() const;
    bool sameKind(const Action &other) const { return kind_ == other.kind_; }

    std::string syntaxHelp() const;
    std::string successMessage() const;

private:
    explicit Action(Kind kind) : kind_(kind) {}
    Action(Kind kind, const Argument<Coordinate> &coord);
    Action(Kind kind, const Argument<int> &shipLength);

    Kind kind_;
    Argument<Coordinate> coordinate_;
    Argument<int> shipLength_;
    ShipLocation sunkCells_;
};

bool operator==(const Action &a, const Action &b);
bool operator!=(const Action &a, const Action &b);

#endif
