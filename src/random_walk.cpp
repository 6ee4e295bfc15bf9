#include "random_walk.hpp"

#include "grid_utils.hpp"

#include <array>
#include <sstream>

namespace procmaps {

RandomWalk::RandomWalk(int w, int h, uint32_t seed)
    : rng_(hashCombine(seed, "WALK"_tag)),
      tiles_(w, h, WalkTile::Empty, WalkTile::Empty),
      cursor_{w / 2, h / 2} {}

std::optional<RandomWalk> RandomWalk::create(const RandomWalkParams& p, MapGenError* err) {
    if (p.width <= 0 || p.height <= 0) {
        std::ostringstream ss;
        ss << "random walk dimensions must be positive (got " << p.width << "x" << p.height << ")";
        fail(err, MapGenErrorKind::InvalidConfiguration, ss.str());
        return std::nullopt;
    }
    return RandomWalk(p.width, p.height, p.seed);
}

std::optional<RandomWalk> RandomWalk::generate(const RandomWalkParams& p, MapGenError* err) {
    std::optional<RandomWalk> walk = create(p, err);
    if (!walk) return std::nullopt;

    if (!walk->carveFloor(p.maxSteps, p.intersectionAllowance, err)) return std::nullopt;
    walk->markWalls();
    return walk;
}

std::optional<CarveResult> RandomWalk::carveFloor(int maxSteps, double intersectionAllowance, MapGenError* err) {
    if (maxSteps < 0 && maxSteps != kUnlimitedSteps) {
        fail(err, MapGenErrorKind::InvalidConfiguration, "max steps must be >= 0 or unlimited");
        return std::nullopt;
    }
    if (!(intersectionAllowance >= 0.0 && intersectionAllowance <= 1.0)) {
        fail(err, MapGenErrorKind::InvalidConfiguration, "intersection allowance must be within [0,1]");
        return std::nullopt;
    }
    // A full allowance accepts every in-bounds direction, so the walk can
    // only end on its step budget.
    if (intersectionAllowance >= kFullIntersection && maxSteps == kUnlimitedSteps) {
        fail(err, MapGenErrorKind::InvalidConfiguration, "full intersection allowance needs a step budget");
        return std::nullopt;
    }

    CarveResult out;
    canWalk_ = true;

    while ((maxSteps == kUnlimitedSteps || maxSteps > 0) && canWalk_) {
        // Directions still on offer this attempt; drawn without replacement.
        std::array<int, 4> remaining = {0, 1, 2, 3};
        size_t left = remaining.size();
        canWalk_ = false;

        while (left > 0) {
            const size_t pick = rng_.pick(left);
            const int dir = remaining[pick];
            for (size_t i = pick; i + 1 < left; ++i) remaining[i] = remaining[i + 1];
            --left;

            const int nx = cursor_.x + kDirs4[dir][0];
            const int ny = cursor_.y + kDirs4[dir][1];
            if (!tiles_.inBounds(nx, ny)) continue;

            WalkTile& target = tiles_.at(nx, ny);
            // The intersection roll is only drawn for tiles that are not Empty.
            const bool accept = (target == WalkTile::Empty) ||
                                (intersectionAllowance != kNoIntersection && rng_.next01() <= intersectionAllowance);
            if (!accept) continue;

            cursor_ = {nx, ny};
            if (target != WalkTile::Floor) ++out.tilesCarved;
            target = WalkTile::Floor;
            canWalk_ = true;
            break;
        }

        ++out.stepsTaken;
        if (maxSteps != kUnlimitedSteps) --maxSteps;
    }

    out.stuck = !canWalk_;
    return out;
}

int RandomWalk::markWalls() {
    int added = 0;
    for (int y = 0; y < tiles_.height(); ++y) {
        for (int x = 0; x < tiles_.width(); ++x) {
            if (tiles_.at(x, y) != WalkTile::Empty) continue;

            bool touchesFloor = false;
            for (const auto& d : kDirs8) {
                if (tiles_.get(x + d[0], y + d[1]) == WalkTile::Floor) {
                    touchesFloor = true;
                    break;
                }
            }
            if (!touchesFloor) continue;

            tiles_.at(x, y) = WalkTile::Wall;
            ++added;
        }
    }
    return added;
}

int RandomWalk::countTiles(WalkTile t) const {
    int n = 0;
    for (WalkTile v : tiles_.cells()) {
        if (v == t) ++n;
    }
    return n;
}

} // namespace procmaps
