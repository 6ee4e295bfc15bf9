#pragma once

#include "charge_field.hpp"
#include "random_walk.hpp"
#include "region_growth.hpp"

#include <cstdint>
#include <string>

namespace procmaps {

enum class GeneratorKind : uint8_t {
    Charge = 0,
    Walk,
    Regions,
};

const char* generatorName(GeneratorKind k);
bool parseGeneratorKind(const std::string& s, GeneratorKind& out);

// Simple user-editable settings file (INI-ish: key = value).
// Shared by the headless CLI and the preview viewer; CLI flags override it.
struct Settings {
    GeneratorKind generator = GeneratorKind::Walk;
    uint32_t seed = 0;
    int width = 200;
    int height = 200;

    // Charge field
    int chargePositive = 10;
    int chargeNegative = 5;
    double chargeCutoffMultiplier = 1.0;

    // Random walk
    // - walk_passes: number of carveFloor() passes before markWalls().
    // - walk_extra_intersection: allowance used for passes after the first.
    double walkIntersection = kBasicIntersection;
    int walkMaxSteps = kUnlimitedSteps;
    int walkPasses = 1;
    double walkExtraIntersection = 0.82;

    // Region growth
    int regionSeeds = 10;

    // Pixels per cell for PPM export and the viewer.
    int cellSize = 4;

    ChargeFieldParams chargeParams() const;
    RandomWalkParams walkParams() const;
    RegionGrowthParams regionParams() const;
};

// Applies a single key = value pair. Unknown keys and malformed values are
// ignored (returns false); numeric values are clamped.
bool applySetting(Settings& s, const std::string& key, const std::string& value);

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file.
bool writeDefaultSettings(const std::string& path, std::string* err = nullptr);

} // namespace procmaps
