#include "region_growth.hpp"

#include "grid_utils.hpp"
#include "rng.hpp"

#include <algorithm>
#include <sstream>

namespace procmaps {

namespace {

bool validateDims(int width, int height, MapGenError* err) {
    if (width > 0 && height > 0) return true;
    std::ostringstream ss;
    ss << "region grid dimensions must be positive (got " << width << "x" << height << ")";
    return fail(err, MapGenErrorKind::InvalidConfiguration, ss.str());
}

} // namespace

bool Region::hasNeighbor(int other) const {
    return std::find(neighbors.begin(), neighbors.end(), other) != neighbors.end();
}

RegionGrowth::RegionGrowth(int w, int h)
    : ids_(w, h, kUnclaimed, kOutOfBounds) {}

std::optional<RegionGrowth> RegionGrowth::generate(const RegionGrowthParams& p, MapGenError* err) {
    if (!validateDims(p.width, p.height, err)) return std::nullopt;
    if (p.numSeeds < 1) {
        fail(err, MapGenErrorKind::InvalidConfiguration, "region growth needs at least one seed");
        return std::nullopt;
    }

    RNG rng(hashCombine(p.seed, "REGIONS"_tag));
    std::vector<Vec2i> origins;
    origins.reserve(static_cast<size_t>(p.numSeeds));
    for (int i = 0; i < p.numSeeds; ++i) {
        Vec2i o;
        o.x = rng.range(0, p.width - 1);
        o.y = rng.range(0, p.height - 1);
        origins.push_back(o);
    }

    return fromOrigins(p.width, p.height, origins, err);
}

std::optional<RegionGrowth> RegionGrowth::fromOrigins(int width, int height, const std::vector<Vec2i>& origins,
                                                      MapGenError* err) {
    if (!validateDims(width, height, err)) return std::nullopt;
    if (origins.empty()) {
        fail(err, MapGenErrorKind::InvalidConfiguration, "region growth needs at least one seed");
        return std::nullopt;
    }
    for (size_t i = 0; i < origins.size(); ++i) {
        const Vec2i& o = origins[i];
        if (o.x < 0 || o.y < 0 || o.x >= width || o.y >= height) {
            std::ostringstream ss;
            ss << "origin " << (i + 1) << " (" << o.x << "," << o.y << ") lies outside the grid";
            fail(err, MapGenErrorKind::InvalidConfiguration, ss.str());
            return std::nullopt;
        }
    }

    RegionGrowth rg(width, height);
    rg.regions_.reserve(origins.size());
    for (size_t i = 0; i < origins.size(); ++i) {
        Region r;
        r.id = static_cast<int>(i) + 1;
        r.origin = origins[i];
        rg.regions_.push_back(std::move(r));
    }

    rg.grow();
    return rg;
}

void RegionGrowth::grow() {
    const size_t n = regions_.size();

    std::vector<std::vector<Vec2i>> frontier(n);
    for (size_t i = 0; i < n; ++i) frontier[i].push_back(regions_[i].origin);

    // Per-cell stamp of the last (round, region) that queued it, so each
    // region's next frontier stays duplicate-free without a set per region.
    std::vector<uint64_t> queuedStamp(ids_.size(), 0);
    uint64_t stamp = 0;

    bool active = true;
    while (active) {
        active = false;
        bool claimedAny = false;
        std::vector<std::vector<Vec2i>> next(n);

        for (size_t i = 0; i < n; ++i) {
            Region& r = regions_[i];
            ++stamp;

            for (const Vec2i& p : frontier[i]) {
                int& owner = ids_.at(p.x, p.y);

                if (owner == kUnclaimed) {
                    owner = r.id;
                    r.positions.push_back(p);
                    claimedAny = true;

                    forEachNeighbor8(ids_, p, [&](const Vec2i& q) {
                        const size_t qi = static_cast<size_t>(q.y) * static_cast<size_t>(ids_.width()) +
                                          static_cast<size_t>(q.x);
                        if (queuedStamp[qi] == stamp) return;
                        queuedStamp[qi] = stamp;
                        next[i].push_back(q);
                    });
                } else if (owner != r.id && !r.hasNeighbor(owner)) {
                    r.neighbors.push_back(owner);
                }
            }

            if (!next[i].empty()) active = true;
        }

        if (claimedAny) ++rounds_;
        frontier.swap(next);
    }
}

const std::vector<Vec2i>& RegionGrowth::positionsOf(int id) const {
    return region(id).positions;
}

const Region& RegionGrowth::region(int id) const {
    static const Region kSentinel{};
    if (!hasRegion(id)) return kSentinel;
    return regions_[static_cast<size_t>(id - 1)];
}

std::vector<std::vector<int>> symmetricAdjacency(const RegionGrowth& rg) {
    const int n = rg.regionCount();
    std::vector<std::vector<int>> out(static_cast<size_t>(n));

    auto link = [&](int a, int b) {
        std::vector<int>& v = out[static_cast<size_t>(a - 1)];
        if (std::find(v.begin(), v.end(), b) == v.end()) v.push_back(b);
    };

    for (const Region& r : rg.regions()) {
        for (int other : r.neighbors) {
            if (!rg.hasRegion(other)) continue;
            link(r.id, other);
            link(other, r.id);
        }
    }

    for (auto& v : out) std::sort(v.begin(), v.end());
    return out;
}

} // namespace procmaps
