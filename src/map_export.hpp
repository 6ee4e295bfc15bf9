#pragma once

// Export helpers for finished maps.
//
// These only read generator output; nothing here feeds back into generation.
// Colour images are produced at one pixel per cell and scaled on write.

#include "charge_field.hpp"
#include "common.hpp"
#include "grid.hpp"
#include "random_walk.hpp"
#include "region_growth.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace procmaps {

struct MapImage {
    int width = 0;
    int height = 0;
    std::vector<Color> pixels; // row-major

    Color& at(int x, int y) { return pixels[static_cast<size_t>(y * width + x)]; }
    const Color& at(int x, int y) const { return pixels[static_cast<size_t>(y * width + x)]; }
};

// Stable per-region colour (hashed from the id); unclaimed cells are black.
Color regionColor(int id);

// Greyscale by magnitude relative to the field maximum; water (0) is dark blue.
MapImage rasterize(const ChargeField& cf);
// Empty = black, Floor = sand, Wall = stone grey.
MapImage rasterize(const RandomWalk& walk);
// Hashed colours per region, origins marked red.
MapImage rasterize(const RegionGrowth& rg);

// One character per cell.
//   charge:  '.' water, '+' land, '#' land above twice the cutoff
//   walk:    ' ' empty, '.' floor, '#' wall
//   regions: id in base-36 (0-9a-z), cycling for ids above 35; '?' unclaimed
std::string toAscii(const ChargeField& cf);
std::string toAscii(const RandomWalk& walk);
std::string toAscii(const RegionGrowth& rg);

// Binary PPM (P6), each cell drawn as a scale x scale block.
bool writePpm(const std::string& path, const MapImage& img, int scale, std::string* err = nullptr);

std::string jsonEscape(const std::string& s);

// Short machine-readable summaries for --json-report.
void writeJsonSummary(std::ostream& out, const ChargeField& cf);
void writeJsonSummary(std::ostream& out, const RandomWalk& walk);
void writeJsonSummary(std::ostream& out, const RegionGrowth& rg);

} // namespace procmaps
