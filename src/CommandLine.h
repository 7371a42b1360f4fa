#ifndef SALVO_COMMANDLINE_H
#define SALVO_COMMANDLINE_H

#include <string>

#include "Action.h"
#include "GameState.h"

// Turns one line of input into an action. Arguments left out stay unknown
// for actions that can infer them.
Action parseCommand(const std::string &input);

// Fills in missing arguments from the recommendations and the history
Action resolveAction(const Action &action, const GameState &state);

// Parses, resolves and executes one line; returns the message to show
std::string runCommand(const std::string &input, GameState &state);

std::string helpText();

#endif
