#include "HeatMap.h"

#include <algorithm>
#include <limits>
#include <sstream>

using namespace std;

string HeatWarning::message() const {
    ostringstream oss;
    switch (kind) {
        case ShipDoesNotFit:
            oss << "Ship of length " << shipLength << " couldn't be placed a single time.";
            break;
        case HitsUnexplained:
            oss << "No ship fits the given hit(s).";
            break;
    }
    return oss.str();
}

/**
 * @brief Builds the heat field for the current board
 *
 * Two sources are computed independently: the density of every legal
 * placement of each remaining ship, and the density of the placements that
 * run through a known hit. They are combined as independent events and
 * every cell that is already resolved is forced to zero.
 *
 * @param shots What is known about each cell
 * @param ships Lengths of the ships still afloat
 * @return The heat field and any inconsistency found on the way
 */
HeatResult genHeatField(const Grid<ShotStatus> &shots, const vector<int> &ships) {
    Grid<bool> boolShots = shots.transform(canContainShip);
    vector<Coordinate> hits = shots.findAll([](ShotStatus s) { return s == ShotStatus::Hit; });

    vector<HeatWarning> warnings;
    vector<Grid<float>> sources;
    sources.push_back(genBasicHeat(boolShots, ships, warnings));
    sources.push_back(genHitHeat(boolShots, hits, ships, warnings));

    Grid<float> combined = combineHeat(sources);

    HeatResult result{
        combined.merge(shots, [](float heat, ShotStatus status) {
            return status == ShotStatus::Untested ? heat : 0.0f;
        }),
        warnings};
    return result;
}

vector<Coordinate> genTopMoves(const Grid<float> &heat, const Grid<ShotStatus> &shots) {
    vector<Coordinate> candidates =
        shots.findAll([](ShotStatus s) { return s == ShotStatus::Untested; });

    float best = -numeric_limits<float>::infinity();
    for (const auto &coord : candidates) best = max(best, heat.getValue(coord));

    vector<Coordinate> top;
    for (const auto &coord : candidates) {
        if (best - heat.getValue(coord) <= numeric_limits<float>::epsilon())
            top.push_back(coord);
    }
    return top;
}

Grid<float> genBasicHeat(const Grid<bool> &boolShots, const vector<int> &ships,
                         vector<HeatWarning> &warnings) {
    vector<Grid<float>> perShip;

    for (int shipLength : ships) {
        Grid<size_t> counts(boolShots.width(), boolShots.height());
        size_t total = 0;

        for (Axis axis : {Axis::Row, Axis::Column}) {
            for (size_t index = 0; index < boolShots.linesInAxis(axis); ++index) {
                LineCounts line = genLine(boolShots.getLine(axis, index),
                                          static_cast<size_t>(max(shipLength, 0)));
                counts.mergeLine(axis, index, line.counts,
                                 [](size_t acc, size_t c) { return acc + c; });
                total += line.placements;
            }
        }

        if (total == 0) {
            // Keep going with an empty contribution so the board stays usable
            warnings.push_back(HeatWarning{HeatWarning::ShipDoesNotFit, shipLength});
            perShip.push_back(Grid<float>(boolShots.width(), boolShots.height(), 0.0f));
            continue;
        }

        const float totalF = static_cast<float>(total);
        perShip.push_back(counts.transform([totalF](size_t c) { return c / totalF; }));
    }

    if (perShip.empty()) return Grid<float>(boolShots.width(), boolShots.height(), 0.0f);
    return combineHeat(perShip);
}

Grid<float> genHitHeat(const Grid<bool> &boolShots, const vector<Coordinate> &hits,
                       const vector<int> &ships, vector<HeatWarning> &warnings) {
    if (hits.empty() || ships.empty())
        return Grid<float>(boolShots.width(), boolShots.height(), 0.0f);

    vector<Grid<float>> perShip;
    bool anyPlaced = false;

    for (int shipLength : ships) {
        const size_t len = static_cast<size_t>(max(shipLength, 0));
        Grid<float> heat(boolShots.width(), boolShots.height(), 0.0f);

        for (const auto &hit : hits) {
            auto lines = boolShots.getLinesContext(hit);
            LineCounts row = genLine(maskAroundHit(lines.first, hit.column, len), len);
            LineCounts column = genLine(maskAroundHit(lines.second, hit.row, len), len);

            const size_t total = row.placements + column.placements;
            if (total == 0) continue; // the hit belongs to some other ship
            anyPlaced = true;

            const float totalF = static_cast<float>(total);
            auto addShare = [totalF](float acc, size_t c) { return acc + c / totalF; };
            heat.mergeLine(Axis::Row, hit.row, row.counts, addShare);
            heat.mergeLine(Axis::Column, hit.column, column.counts, addShare);
        }

        const float hitCount = static_cast<float>(hits.size());
        perShip.push_back(heat.transform([hitCount](float val) {
            return min(1.0f, val / hitCount);
        }));
    }

    if (!anyPlaced) warnings.push_back(HeatWarning{HeatWarning::HitsUnexplained, 0});

    return combineHeat(perShip);
}

Grid<float> combineHeat(const vector<Grid<float>> &fields) {
    if (fields.empty()) return Grid<float>(0, 0);

    // Multiply the chances of a cell being empty, then invert back
    Grid<float> empty(fields.front().width(), fields.front().height(), 1.0f);
    for (const auto &field : fields) {
        empty = empty.merge(field, [](float acc, float p) { return acc * (1.0f - p); });
    }
    return empty.transform([](float val) { return 1.0f - val; });
}

vector<pair<size_t, bool>> getStreaks(const vector<bool> &line) {
    vector<pair<size_t, bool>> streaks;
    for (size_t i = 0; i < line.size(); ++i) {
        if (!streaks.empty() && streaks.back().second == line[i]) streaks.back().first++;
        else streaks.push_back(make_pair(static_cast<size_t>(1), static_cast<bool>(line[i])));
    }
    return streaks;
}

/**
 * @brief Counts how many placements of a ship cover each cell of a free run
 *
 * A run of `space` free cells holds space - shipLength + 1 placements. Cell i
 * is covered by min(i + 1, space - i, shipLength, placements) of them.
 *
 * @param space Length of the free run
 * @param shipLength Length of the ship
 * @return Per-cell coverage and the number of placements
 */
LineCounts genFreeSpace(size_t space, size_t shipLength) {
    LineCounts out;
    if (shipLength == 0 || shipLength > space) {
        out.counts.assign(space, 0);
        return out;
    }

    out.placements = space - shipLength + 1;
    out.counts.reserve(space);
    for (size_t i = 0; i < space; ++i) {
        size_t leftDist = i + 1;
        size_t rightDist = space - i;
        out.counts.push_back(min(min(leftDist, rightDist), min(shipLength, out.placements)));
    }
    return out;
}

LineCounts genLine(const vector<bool> &line, size_t shipLength) {
    LineCounts out;
    out.counts.reserve(line.size());

    for (const auto &streak : getStreaks(line)) {
        if (!streak.second) {
            out.counts.insert(out.counts.end(), streak.first, 0);
            continue;
        }
        LineCounts section = genFreeSpace(streak.first, shipLength);
        out.counts.insert(out.counts.end(), section.counts.begin(), section.counts.end());
        out.placements += section.placements;
    }
    return out;
}

vector<bool> maskAroundHit(const vector<bool> &line, size_t hitIndex, size_t shipLength) {
    vector<bool> masked(line);
    for (size_t i = 0; i < masked.size(); ++i) {
        if (i + shipLength <= hitIndex || hitIndex + shipLength <= i) masked[i] = false;
    }
    return masked;
}
