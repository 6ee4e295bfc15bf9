#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace procmaps {

namespace {

constexpr int kMaxDimension = 4096;

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

bool parseInt(const std::string& v, int& out) {
    const std::string t = trim(v);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        const int parsed = std::stoi(t, &used, 10);
        if (used != t.size()) return false;
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string t = trim(v);
    if (t.empty() || t[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long parsed = std::stoull(t, &used, 0);
        if (used != t.size() || parsed > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parseDouble(const std::string& v, double& out) {
    const std::string t = trim(v);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        const double parsed = std::stod(t, &used);
        if (used != t.size()) return false;
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

const char* generatorName(GeneratorKind k) {
    switch (k) {
        case GeneratorKind::Charge: return "charge";
        case GeneratorKind::Walk: return "walk";
        case GeneratorKind::Regions: return "regions";
    }
    return "walk";
}

bool parseGeneratorKind(const std::string& s, GeneratorKind& out) {
    const std::string v = toLower(trim(s));
    if (v == "charge" || v == "chargefield") {
        out = GeneratorKind::Charge;
    } else if (v == "walk" || v == "drunkwalk") {
        out = GeneratorKind::Walk;
    } else if (v == "regions" || v == "voronoi") {
        out = GeneratorKind::Regions;
    } else {
        return false;
    }
    return true;
}

ChargeFieldParams Settings::chargeParams() const {
    ChargeFieldParams p;
    p.seed = seed;
    p.width = width;
    p.height = height;
    p.numPositive = chargePositive;
    p.numNegative = chargeNegative;
    p.cutoffMultiplier = chargeCutoffMultiplier;
    return p;
}

RandomWalkParams Settings::walkParams() const {
    RandomWalkParams p;
    p.seed = seed;
    p.width = width;
    p.height = height;
    p.intersectionAllowance = walkIntersection;
    p.maxSteps = walkMaxSteps;
    return p;
}

RegionGrowthParams Settings::regionParams() const {
    RegionGrowthParams p;
    p.seed = seed;
    p.width = width;
    p.height = height;
    p.numSeeds = regionSeeds;
    return p;
}

bool applySetting(Settings& s, const std::string& rawKey, const std::string& rawVal) {
    const std::string key = toLower(trim(rawKey));
    const std::string val = trim(rawVal);

    int i = 0;
    double d = 0.0;

    if (key == "generator") {
        GeneratorKind k = s.generator;
        if (!parseGeneratorKind(val, k)) return false;
        s.generator = k;
    } else if (key == "seed") {
        uint32_t v = 0;
        if (!parseU32(val, v)) return false;
        s.seed = v;
    } else if (key == "width") {
        if (!parseInt(val, i)) return false;
        s.width = clampi(i, 1, kMaxDimension);
    } else if (key == "height") {
        if (!parseInt(val, i)) return false;
        s.height = clampi(i, 1, kMaxDimension);
    } else if (key == "charge_positive") {
        if (!parseInt(val, i)) return false;
        s.chargePositive = clampi(i, 0, 100000);
    } else if (key == "charge_negative") {
        if (!parseInt(val, i)) return false;
        s.chargeNegative = clampi(i, 0, 100000);
    } else if (key == "charge_cutoff_multiplier") {
        if (!parseDouble(val, d)) return false;
        s.chargeCutoffMultiplier = std::clamp(d, -100.0, 100.0);
    } else if (key == "walk_intersection") {
        if (!parseDouble(val, d)) return false;
        s.walkIntersection = std::clamp(d, 0.0, 1.0);
    } else if (key == "walk_max_steps") {
        if (!parseInt(val, i)) return false;
        s.walkMaxSteps = (i < 0) ? kUnlimitedSteps : i;
    } else if (key == "walk_passes") {
        if (!parseInt(val, i)) return false;
        s.walkPasses = clampi(i, 1, 16);
    } else if (key == "walk_extra_intersection") {
        if (!parseDouble(val, d)) return false;
        s.walkExtraIntersection = std::clamp(d, 0.0, 1.0);
    } else if (key == "region_seeds") {
        if (!parseInt(val, i)) return false;
        s.regionSeeds = clampi(i, 1, 100000);
    } else if (key == "cell_size") {
        if (!parseInt(val, i)) return false;
        s.cellSize = clampi(i, 1, 64);
    } else {
        return false;
    }
    return true;
}

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = trim(line.substr(0, cut));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        applySetting(s, line.substr(0, eq), line.substr(eq + 1));
    }

    return s;
}

bool writeDefaultSettings(const std::string& path, std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Unable to open settings file for writing: " + path;
        return false;
    }

    f << R"INI(# procmaps settings
#
# Lines are: key = value
# Comments start with # or ;
# Command line flags override anything set here.

# generator: charge | walk | regions
generator = walk
seed = 0
width = 200
height = 200

# Charge field
charge_positive = 10
charge_negative = 5
# cutoff = mean field * multiplier; cells below the cutoff become water (0)
charge_cutoff_multiplier = 1.0

# Random walk
# walk_intersection: 0.0 (never re-enter floor) .. 1.0 (always may; needs walk_max_steps >= 0)
walk_intersection = 0.75
# walk_max_steps: -1 = walk until stuck
walk_max_steps = -1
# walk_passes: extra passes reuse the cursor and use walk_extra_intersection
walk_passes = 1
walk_extra_intersection = 0.82

# Region growth
region_seeds = 10

# Pixels per cell for --ppm export and the viewer
cell_size = 4
)INI";

    if (!f) {
        if (err) *err = "Failed writing settings file: " + path;
        return false;
    }
    return true;
}

} // namespace procmaps
