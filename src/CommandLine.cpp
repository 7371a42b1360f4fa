#include "CommandLine.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace std;

static vector<string> splitWords(const string &input) {
    istringstream iss(input);
    vector<string> words;
    string word;
    while (iss >> word) words.push_back(word);
    return words;
}

static string toLower(string s) {
    transform(s.begin(), s.end(), s.begin(),
              [](unsigned char ch) { return static_cast<char>(tolower(ch)); });
    return s;
}

// Positive whole numbers only; 1-indexed input has no use for 0
static int parseNumber(const string &word) {
    bool digitsOnly = !word.empty() && word.size() <= 9 &&
                      all_of(word.begin(), word.end(),
                             [](unsigned char ch) { return isdigit(ch) != 0; });
    if (!digitsOnly) throw GameError("Unable to read given numeric value.");

    int value = stoi(word);
    if (value == 0) throw GameError("Unable to read given numeric value.");
    return value;
}

static Action parseActionName(const string &word) {
    string name = toLower(word);
    for (const auto &action : Action::allActions()) {
        if (action.name() == name) return action;
    }
    throw GameError("Invalid command.");
}

Action parseCommand(const string &input) {
    vector<string> words = splitWords(input);
    if (words.empty()) throw GameError("Unable to parse command.");

    Action action = parseActionName(words[0]);
    const int argCount = static_cast<int>(words.size()) - 1;

    if (argCount == 0) {
        if (action.canInferArgs()) return action;
        throw GameError("No Arguments provided. Can't infer arguments for this action.");
    }
    if (argCount != action.expectedArgCount()) throw GameError("Incorrect number of arguments.");

    if (action.isCoordinateAction()) {
        int column = parseNumber(words[1]);
        int row = parseNumber(words[2]);
        Coordinate coord = Coordinate::fromUser(column, row);

        switch (action.kind()) {
            case Action::Fire:   return Action::fire(coord);
            case Action::Hit:    return Action::hit(coord);
            case Action::Unfire: return Action::unfire(coord);
            default: break;
        }
    } else if (action.isLengthAction()) {
        int shipLength = parseNumber(words[1]);
        return action.kind() == Action::Sink ? Action::sink(shipLength)
                                             : Action::unsink(shipLength);
    }
    throw logic_error("Unhandled action '" + action.name() + "'.");
}

Action resolveAction(const Action &action, const GameState &state) {
    if (action.hasKnownArgs()) return action;

    switch (action.kind()) {
        // "fire" means the recommended move
        case Action::Fire:
            if (state.topMoves().empty()) throw GameError("No recommended move available.");
            return Action::fire(state.topMoves().front());

        // "hit" means the last shot landed
        case Action::Hit:
            return Action::hit(state.lastMatchingAction(Action::fire()).coordinate().value);

        // the "un-" actions revert their last opposite
        case Action::Unfire:
        case Action::Unsink:
            return state.lastMatchingAction(action.opposite()).opposite();

        case Action::Sink:
            throw logic_error("Cannot infer length of sunk ship.");
        case Action::Undo:
            break;
    }
    return action;
}

string runCommand(const string &input, GameState &state) {
    Action action = resolveAction(parseCommand(input), state);

    string report;
    if (action.kind() == Action::Undo) {
        Action last = state.lastAction();
        report = "Successfully undid '" + last.name() + "'.\n" + last.opposite().successMessage();
    } else {
        report = action.successMessage();
    }

    state.takeAction(action);

    if (state.isGameOver()) report += "\nGame is over, go home :)";
    return report;
}

string helpText() {
    string text = "Available commands:\n";
    for (const auto &action : Action::allActions()) text += action.syntaxHelp() + "\n";
    return text;
}
