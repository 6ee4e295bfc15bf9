#pragma once

// Random walk ("drunk walk") corridor carver
//
// A single cursor wanders over an initially empty grid. Each step attempt
// offers the four cardinal directions in random order and takes the first one
// that stays in bounds and either enters an Empty tile or passes the
// intersection roll. The walk stops when the step budget runs out or when
// no direction is accepted (stuck).
//
// Walls are derived afterwards by markWalls(): every Empty tile touching a
// Floor tile (8-neighborhood) becomes Wall.
//
// The cursor, RNG and grid persist between carveFloor() calls, so several
// passes with different allowances can be layered on one map.

#include "common.hpp"
#include "grid.hpp"
#include "mapgen_error.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>

namespace procmaps {

enum class WalkTile : uint8_t {
    Empty = 0,
    Floor,
    Wall,
};

constexpr double kNoIntersection = 0.0;
constexpr double kBasicIntersection = 0.75;
constexpr double kFullIntersection = 1.0;
constexpr int kUnlimitedSteps = -1;

struct RandomWalkParams {
    uint32_t seed = 0;
    int width = 100;
    int height = 100;
    // Only used by RandomWalk::generate().
    double intersectionAllowance = kBasicIntersection;
    int maxSteps = kUnlimitedSteps;
};

struct CarveResult {
    int stepsTaken = 0;   // attempts consumed, successful or not
    int tilesCarved = 0;  // Empty/Wall -> Floor conversions
    bool stuck = false;   // ended because no direction was accepted
};

class RandomWalk {
public:
    // Empty grid, cursor at the centre. Fails on non-positive dimensions.
    static std::optional<RandomWalk> create(const RandomWalkParams& p, MapGenError* err = nullptr);

    // create() + carveFloor(p.maxSteps, p.intersectionAllowance) + markWalls().
    static std::optional<RandomWalk> generate(const RandomWalkParams& p, MapGenError* err = nullptr);

    // maxSteps: kUnlimitedSteps or >= 0. intersectionAllowance: [0,1].
    // kFullIntersection requires a finite step budget.
    // Invalid arguments leave the walk untouched and return std::nullopt.
    std::optional<CarveResult> carveFloor(int maxSteps, double intersectionAllowance, MapGenError* err = nullptr);

    // Returns the number of tiles turned into Wall.
    int markWalls();

    int width() const { return tiles_.width(); }
    int height() const { return tiles_.height(); }

    // Empty outside the grid.
    WalkTile tileAt(int x, int y) const { return tiles_.get(x, y); }
    bool isFloor(int x, int y) const { return tileAt(x, y) == WalkTile::Floor; }

    Vec2i cursor() const { return cursor_; }
    bool canWalk() const { return canWalk_; }

    int countTiles(WalkTile t) const;

    const Grid<WalkTile>& grid() const { return tiles_; }

private:
    RandomWalk(int w, int h, uint32_t seed);

    RNG rng_;
    Grid<WalkTile> tiles_;
    Vec2i cursor_;
    bool canWalk_ = true;
};

} // namespace procmaps
