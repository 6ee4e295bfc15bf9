#pragma once

#include "charge_field.hpp"
#include "map_export.hpp"
#include "random_walk.hpp"
#include "region_growth.hpp"
#include "settings.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace procmaps {

// Runs whichever generator the settings select and keeps the result.
//
// Shared by the headless CLI and the viewer so both produce the same map for
// the same settings. Exactly one of the optionals is engaged after a
// successful run.
struct GeneratedMap {
    GeneratorKind kind = GeneratorKind::Walk;
    std::optional<ChargeField> charge;
    std::optional<RandomWalk> walk;
    std::optional<RegionGrowth> regions;

    int width() const;
    int height() const;
};

// Random walk with settings.walkPasses carve passes: the first uses
// walkIntersection, later ones walkExtraIntersection, all with walkMaxSteps.
// Walls are marked once at the end.
bool runGenerator(const Settings& s, GeneratedMap& out, MapGenError* err = nullptr);

MapImage rasterize(const GeneratedMap& m);
std::string toAscii(const GeneratedMap& m);
void writeJsonSummary(std::ostream& out, const GeneratedMap& m);

// FNV-1a 64 over the final grid contents. Stable across runs and platforms
// for the same settings; used to spot nondeterminism.
uint64_t mapHash(const GeneratedMap& m);

} // namespace procmaps
