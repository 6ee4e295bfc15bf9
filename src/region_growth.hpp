#pragma once

// Multi-source region growth ("Voronoi" partition)
//
// Every seed point owns a region. Regions grow outward in synchronized rounds:
// in each round, regions are visited in ascending id order and each one tries
// to claim the positions on its current frontier. A claimed cell pushes its
// 8 neighbors onto the region's next frontier; a cell already owned by
// another region records that region as a neighbor instead.
//
// Contested cells go to whichever region reaches them in the earliest round,
// then to the lowest id. This is a discrete approximation of a Voronoi
// diagram, not a Euclidean one.
//
// Neighbor lists are one-directional: region A lists B only if A's frontier
// ran into B's territory. Use symmetricAdjacency() when both directions are
// needed.

#include "common.hpp"
#include "grid.hpp"
#include "mapgen_error.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace procmaps {

constexpr int kUnclaimed = 0;
constexpr int kOutOfBounds = -1;
constexpr int kUnknownRegion = -1;

struct Region {
    int id = kUnknownRegion;
    Vec2i origin{-1, -1};
    std::vector<Vec2i> positions;  // claim order
    std::vector<int> neighbors;    // discovery order, no duplicates

    bool hasNeighbor(int other) const;
};

struct RegionGrowthParams {
    uint32_t seed = 0;
    int width = 200;
    int height = 200;
    int numSeeds = 10;
};

class RegionGrowth {
public:
    // Draws p.numSeeds origins (with replacement) and grows them.
    static std::optional<RegionGrowth> generate(const RegionGrowthParams& p, MapGenError* err = nullptr);

    // Grows from caller-supplied origins; ids follow vector order starting at 1.
    // Origins must lie inside the grid.
    static std::optional<RegionGrowth> fromOrigins(int width, int height, const std::vector<Vec2i>& origins,
                                                   MapGenError* err = nullptr);

    int width() const { return ids_.width(); }
    int height() const { return ids_.height(); }

    // Region id at (x,y); kUnclaimed if nobody reached it, kOutOfBounds outside.
    int regionAt(int x, int y) const { return ids_.get(x, y); }

    // Member positions of a region, empty for unknown ids.
    const std::vector<Vec2i>& positionsOf(int id) const;

    // Region metadata, or a sentinel (id kUnknownRegion, origin (-1,-1)).
    const Region& region(int id) const;

    bool hasRegion(int id) const { return id >= 1 && id <= static_cast<int>(regions_.size()); }
    int regionCount() const { return static_cast<int>(regions_.size()); }
    const std::vector<Region>& regions() const { return regions_; }

    const Grid<int>& grid() const { return ids_; }

    // Number of wavefront rounds that claimed at least one cell.
    int rounds() const { return rounds_; }

private:
    RegionGrowth(int w, int h);

    void grow();

    Grid<int> ids_;
    std::vector<Region> regions_; // regions_[id - 1]
    int rounds_ = 0;
};

// Neighbor lists with both recording directions merged, indexed by id - 1,
// each sorted ascending.
std::vector<std::vector<int>> symmetricAdjacency(const RegionGrowth& rg);

} // namespace procmaps
