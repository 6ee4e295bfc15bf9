#include "map_runner.hpp"

#include <cstring>
#include <ostream>

namespace procmaps {

namespace {

struct Fnv64 {
    uint64_t h = 1469598103934665603ull;

    void bytes(const void* p, size_t n) {
        const unsigned char* b = static_cast<const unsigned char*>(p);
        for (size_t i = 0; i < n; ++i) {
            h ^= b[i];
            h *= 1099511628211ull;
        }
    }

    void i32(int32_t v) { bytes(&v, sizeof(v)); }
};

} // namespace

int GeneratedMap::width() const {
    if (charge) return charge->width();
    if (walk) return walk->width();
    if (regions) return regions->width();
    return 0;
}

int GeneratedMap::height() const {
    if (charge) return charge->height();
    if (walk) return walk->height();
    if (regions) return regions->height();
    return 0;
}

bool runGenerator(const Settings& s, GeneratedMap& out, MapGenError* err) {
    out = GeneratedMap{};
    out.kind = s.generator;

    switch (s.generator) {
        case GeneratorKind::Charge:
            out.charge = ChargeField::generate(s.chargeParams(), err);
            return out.charge.has_value();

        case GeneratorKind::Walk: {
            out.walk = RandomWalk::create(s.walkParams(), err);
            if (!out.walk) return false;
            for (int pass = 0; pass < s.walkPasses; ++pass) {
                const double allowance = (pass == 0) ? s.walkIntersection : s.walkExtraIntersection;
                if (!out.walk->carveFloor(s.walkMaxSteps, allowance, err)) {
                    out.walk.reset();
                    return false;
                }
            }
            out.walk->markWalls();
            return true;
        }

        case GeneratorKind::Regions:
            out.regions = RegionGrowth::generate(s.regionParams(), err);
            return out.regions.has_value();
    }
    return fail(err, MapGenErrorKind::InvalidConfiguration, "unknown generator");
}

MapImage rasterize(const GeneratedMap& m) {
    if (m.charge) return rasterize(*m.charge);
    if (m.walk) return rasterize(*m.walk);
    if (m.regions) return rasterize(*m.regions);
    return MapImage{};
}

std::string toAscii(const GeneratedMap& m) {
    if (m.charge) return toAscii(*m.charge);
    if (m.walk) return toAscii(*m.walk);
    if (m.regions) return toAscii(*m.regions);
    return std::string();
}

void writeJsonSummary(std::ostream& out, const GeneratedMap& m) {
    if (m.charge) writeJsonSummary(out, *m.charge);
    else if (m.walk) writeJsonSummary(out, *m.walk);
    else if (m.regions) writeJsonSummary(out, *m.regions);
}

uint64_t mapHash(const GeneratedMap& m) {
    Fnv64 f;
    f.i32(static_cast<int32_t>(m.kind));
    f.i32(m.width());
    f.i32(m.height());

    if (m.charge) {
        for (double v : m.charge->grid().cells()) {
            uint64_t bits = 0;
            std::memcpy(&bits, &v, sizeof(bits));
            f.bytes(&bits, sizeof(bits));
        }
    } else if (m.walk) {
        for (WalkTile t : m.walk->grid().cells()) f.i32(static_cast<int32_t>(t));
    } else if (m.regions) {
        for (int id : m.regions->grid().cells()) f.i32(id);
        for (const Region& r : m.regions->regions()) {
            for (int n : r.neighbors) f.i32(n);
        }
    }
    return f.h;
}

} // namespace procmaps
