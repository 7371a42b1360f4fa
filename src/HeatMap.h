#ifndef SALVO_HEATMAP_H
#define SALVO_HEATMAP_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "Grid.h"
#include "battleship.h"

// Inconsistencies found while building a heat field. They are reported, not
// thrown: the field is still computed with the offending contribution zeroed.
struct HeatWarning {
    enum Kind {
        ShipDoesNotFit,   // a ship length has no legal placement on the board
        HitsUnexplained   // no remaining ship can cover any of the hits
    };

    Kind kind;
    int shipLength; // only meaningful for ShipDoesNotFit

    std::string message() const;
};

struct HeatResult {
    Grid<float> heat;
    std::vector<HeatWarning> warnings;
};

// Per-cell placement counts along one line plus the number of placements
struct LineCounts {
    std::vector<std::size_t> counts;
    std::size_t placements = 0;
};

// Full heat field for the shot grid and remaining ship lengths. Resolved cells
// (hit, miss, sunk) are always 0.
HeatResult genHeatField(const Grid<ShotStatus> &shots, const std::vector<int> &ships);

// Cells attaining the maximum heat among untested cells, row-major
std::vector<Coordinate> genTopMoves(const Grid<float> &heat, const Grid<ShotStatus> &shots);

// Heat of placements unconstrained by hits
Grid<float> genBasicHeat(const Grid<bool> &boolShots, const std::vector<int> &ships,
                         std::vector<HeatWarning> &warnings);

// Heat of placements that cover at least one hit
Grid<float> genHitHeat(const Grid<bool> &boolShots, const std::vector<Coordinate> &hits,
                       const std::vector<int> &ships, std::vector<HeatWarning> &warnings);

// P = 1 - prod(1 - p_i), cell by cell
Grid<float> combineHeat(const std::vector<Grid<float>> &fields);

// Run-length encoding of a line: (length, value) pairs
std::vector<std::pair<std::size_t, bool>> getStreaks(const std::vector<bool> &line);

LineCounts genFreeSpace(std::size_t space, std::size_t shipLength);
LineCounts genLine(const std::vector<bool> &line, std::size_t shipLength);

// Blocks every position a ship of shipLength covering hitIndex cannot reach
std::vector<bool> maskAroundHit(const std::vector<bool> &line, std::size_t hitIndex,
                                std::size_t shipLength);

#endif
