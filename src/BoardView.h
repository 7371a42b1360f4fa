#ifndef SALVO_BOARDVIEW_H
#define SALVO_BOARDVIEW_H

#include <iosfwd>
#include <string>

#include "GameState.h"

// Heat of every untested cell, markers for the rest. With colour on the
// primary recommendation is red and the alternates green.
std::string renderBoard(const GameState &state, bool colour);

std::string renderRecommendations(const GameState &state);

// Lists the candidate locations on `out` and reads a 1-indexed choice from
// `in`, asking again until it gets a valid one
ShipLocationChooser promptShipLocation(std::istream &in, std::ostream &out);

#endif
