#pragma once

#include "common.hpp"

namespace procmaps {

// Small grid helpers shared by the generators.

// Cardinal directions in the order the random walk offers them: W, E, N, S.
constexpr int kDirs4[4][2] = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1},
};

// 8-neighborhood, row by row (dy outer, dx inner), centre skipped.
// Region growth enqueues its frontier in exactly this order.
constexpr int kDirs8[8][2] = {
    {-1, -1}, {0, -1}, {1, -1},
    {-1,  0},          {1,  0},
    {-1,  1}, {0,  1}, {1,  1},
};

// Calls fn(Vec2i) for each in-bounds 8-neighbor of p, in kDirs8 order.
template <typename GridT, typename Fn>
inline void forEachNeighbor8(const GridT& g, const Vec2i& p, const Fn& fn) {
    for (const auto& d : kDirs8) {
        const Vec2i n{p.x + d[0], p.y + d[1]};
        if (!g.inBounds(n)) continue;
        fn(n);
    }
}

} // namespace procmaps
