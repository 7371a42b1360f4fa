// tests/test_game_state.cpp
//
// Coverage for src/GameState.{h,cpp}.
//
// Goals:
//  - Actions change the board/roster and are recorded; undo reverts them exactly
//  - Failed actions leave board, roster and history untouched
//  - Sinking finds the run of hits, asks when it is ambiguous, and unsinking
//    restores the cells it marked
//  - History lookups return the most recent match

#include <doctest/doctest.h>

#include "GameState.h"

#include <stdexcept>
#include <vector>

namespace {

Coordinate At(std::size_t row, std::size_t column)
{
    Coordinate c;
    c.row = row;
    c.column = column;
    return c;
}

bool AllUntested(const GameState& state)
{
    return state.shots().findAll([](ShotStatus s) { return s != ShotStatus::Untested; }).empty();
}

void HitRow(GameState& state, std::size_t row, std::size_t from, std::size_t to)
{
    for (std::size_t c = from; c <= to; ++c) state.takeAction(Action::hit(At(row, c)));
}

} // namespace

TEST_CASE("A new game has a recommendation and no history")
{
    GameState state(9, 7, {2, 3, 3, 4, 5});

    CHECK(state.history().empty());
    CHECK(state.warnings().empty());
    CHECK_FALSE(state.isGameOver());
    CHECK(state.heatField().width() == 9);
    CHECK(state.heatField().height() == 7);
    REQUIRE_FALSE(state.topMoves().empty());
    CHECK(state.topMoves().front() == At(3, 4));

    CHECK_THROWS_AS(GameState(3, 3, {0}), std::invalid_argument);
}

TEST_CASE("Fire marks a miss and refreshes the heat field")
{
    GameState state(9, 7, {2, 3, 3, 4, 5});
    const Coordinate target = state.topMoves().front();

    state.takeAction(Action::fire(target));

    CHECK(state.shots().getValue(target) == ShotStatus::Miss);
    CHECK(state.heatField().getValue(target) == 0.0f);
    CHECK(state.history().size() == 1);
    CHECK(state.topMoves().front() != target);
}

TEST_CASE("Firing and then unfiring the same cell is a no-op on history")
{
    GameState state(9, 7, {2, 3, 3, 4, 5});
    state.takeAction(Action::fire(At(2, 2)));
    state.takeAction(Action::unfire(At(2, 2)));

    CHECK(state.shots().getValue(At(2, 2)) == ShotStatus::Untested);
    CHECK(state.history().empty());
}

TEST_CASE("Undo reverts the most recent action without recording itself")
{
    GameState state(9, 7, {2, 3, 3, 4, 5});
    state.takeAction(Action::fire(At(0, 0)));
    state.takeAction(Action::hit(At(0, 0)));
    CHECK(state.shots().getValue(At(0, 0)) == ShotStatus::Hit);

    state.takeAction(Action::undo());
    CHECK(state.history().size() == 1);
    CHECK(state.shots().getValue(At(0, 0)) == ShotStatus::Untested);

    state.takeAction(Action::undo());
    CHECK(state.history().empty());
    CHECK(AllUntested(state));

    CHECK_THROWS_WITH_AS(state.takeAction(Action::undo()), "No more actions to undo.", GameError);
}

TEST_CASE("Unresolved actions never reach the board")
{
    GameState state(9, 7, {2, 3});
    CHECK_THROWS_AS(state.takeAction(Action::fire()), std::logic_error);
    CHECK_THROWS_AS(state.takeAction(Action::sink()), std::logic_error);
    CHECK(state.history().empty());
}

TEST_CASE("Shots off the board fail and change nothing")
{
    GameState state(4, 4, {2});
    CHECK_THROWS_AS(state.takeAction(Action::fire(At(4, 0))), std::out_of_range);
    CHECK_THROWS_AS(state.takeAction(Action::hit(At(0, 9))), std::out_of_range);
    CHECK(state.history().empty());
    CHECK(AllUntested(state));
}

TEST_CASE("Sinking needs the ship in the roster and a matching run of hits")
{
    GameState state(5, 5, {3, 2});
    HitRow(state, 0, 0, 1);
    const std::size_t historyBefore = state.history().size();

    CHECK_THROWS_WITH_AS(state.takeAction(Action::sink(3)), "Ship doesn't fit existing hits.", GameError);
    CHECK_THROWS_WITH_AS(state.takeAction(Action::sink(4)), "Ship not found.", GameError);

    CHECK(state.ships() == std::vector<int>{3, 2});
    CHECK(state.history().size() == historyBefore);
    CHECK(state.shots().getValue(At(0, 0)) == ShotStatus::Hit);
}

TEST_CASE("Sink marks a unique run as sunk and undo restores the hits")
{
    GameState state(5, 5, {3, 2});
    HitRow(state, 0, 0, 2);

    state.takeAction(Action::sink(3));

    CHECK(state.ships() == std::vector<int>{2});
    for (std::size_t c = 0; c < 3; ++c) CHECK(state.shots().getValue(At(0, c)) == ShotStatus::Sunk);
    CHECK(state.history().back().sunkCells().size() == 3);

    state.takeAction(Action::undo());

    CHECK(state.ships().size() == 2);
    for (std::size_t c = 0; c < 3; ++c) CHECK(state.shots().getValue(At(0, c)) == ShotStatus::Hit);
    CHECK(state.history().size() == 3);
}

TEST_CASE("Ambiguous sinks ask which run of hits the ship was on")
{
    std::vector<ShipLocation> offered;
    std::size_t answer = 1;
    GameState state(5, 5, {3, 2}, [&](const std::vector<ShipLocation>& locations) {
        offered = locations;
        return answer;
    });
    HitRow(state, 0, 0, 3);

    SUBCASE("a valid choice is applied")
    {
        state.takeAction(Action::sink(3));

        REQUIRE(offered.size() == 2);
        CHECK(offered[0].front() == At(0, 0));
        CHECK(offered[1].front() == At(0, 1));
        CHECK(state.shots().getValue(At(0, 0)) == ShotStatus::Hit);
        for (std::size_t c = 1; c < 4; ++c) CHECK(state.shots().getValue(At(0, c)) == ShotStatus::Sunk);
    }

    SUBCASE("an invalid choice changes nothing")
    {
        answer = 5;
        CHECK_THROWS_AS(state.takeAction(Action::sink(3)), std::out_of_range);
        CHECK(state.ships().size() == 2);
        CHECK(state.history().size() == 4);
        CHECK(state.shots().findAll([](ShotStatus s) { return s == ShotStatus::Sunk; }).empty());
    }
}

TEST_CASE("Possible ship locations cover rows then columns without duplicates")
{
    GameState state(4, 4, {2, 1});
    HitRow(state, 1, 1, 2);
    state.takeAction(Action::hit(At(2, 1)));

    std::vector<ShipLocation> pairs = state.possibleShipLocations(2);
    REQUIRE(pairs.size() == 2);
    CHECK(pairs[0] == ShipLocation{At(1, 1), At(1, 2)});
    CHECK(pairs[1] == ShipLocation{At(1, 1), At(2, 1)});

    CHECK(state.possibleShipLocations(1).size() == 3);
    CHECK(state.possibleShipLocations(4).empty());
}

TEST_CASE("Sinking the last ship ends the game until it is undone")
{
    GameState state(3, 1, {2});
    HitRow(state, 0, 0, 1);

    state.takeAction(Action::sink(2));
    CHECK(state.isGameOver());
    CHECK(state.topMoves().empty());
    CHECK(state.warnings().empty());

    state.takeAction(Action::undo());
    CHECK_FALSE(state.isGameOver());
    REQUIRE(state.topMoves().size() == 1);
    CHECK(state.topMoves().front() == At(0, 2));
}

TEST_CASE("Unsink without recorded cells only restores the roster")
{
    GameState state(5, 5, {3});
    state.takeAction(Action::unsink(2));
    CHECK(state.ships() == std::vector<int>{3, 2});
    CHECK(AllUntested(state));
}

TEST_CASE("History lookups return the most recent match")
{
    GameState state(9, 7, {2, 3, 3, 4, 5});
    state.takeAction(Action::fire(At(0, 0)));
    state.takeAction(Action::hit(At(0, 0)));
    state.takeAction(Action::fire(At(4, 4)));

    CHECK(state.lastAction() == Action::fire(At(4, 4)));
    CHECK(state.lastMatchingAction(Action::fire()) == Action::fire(At(4, 4)));
    CHECK(state.lastMatchingAction(Action::hit()) == Action::hit(At(0, 0)));
    CHECK_THROWS_AS(state.lastMatchingAction(Action::sink()), GameError);
    CHECK_THROWS_AS(state.lastMatchingAction(Action::undo()), std::logic_error);

    GameState fresh(9, 7, {2});
    CHECK_THROWS_WITH_AS(fresh.lastAction(), "No more actions to undo.", GameError);
}

TEST_CASE("Impossible rosters are reported as warnings, not failures")
{
    GameState state(3, 3, {5});
    REQUIRE(state.warnings().size() == 1);
    CHECK(state.warnings()[0].kind == HeatWarning::ShipDoesNotFit);
    CHECK_FALSE(state.topMoves().empty());
}
