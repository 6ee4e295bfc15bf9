#pragma once

#include "common.hpp"

#include <cstddef>
#include <vector>

namespace procmaps {

// Fixed-size row-major 2D array.
//
// get() is the bounds-checked read used by neighbor scans: anything outside
// the rectangle reads as the grid's sentinel, so boundary logic can treat the
// outside world as absent. at() is unchecked and meant for loops that already
// iterate inside [0,width) x [0,height).
template <typename T>
class Grid {
public:
    Grid() = default;
    Grid(int w, int h, T fill = T{}, T outside = T{})
        : width_(w > 0 ? w : 0),
          height_(h > 0 ? h : 0),
          sentinel_(outside),
          cells_(static_cast<size_t>(width_) * static_cast<size_t>(height_), fill) {}

    int width() const { return width_; }
    int height() const { return height_; }
    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
    bool inBounds(const Vec2i& p) const { return inBounds(p.x, p.y); }

    T& at(int x, int y) { return cells_[index(x, y)]; }
    const T& at(int x, int y) const { return cells_[index(x, y)]; }

    T get(int x, int y) const {
        if (!inBounds(x, y)) return sentinel_;
        return cells_[index(x, y)];
    }
    T get(const Vec2i& p) const { return get(p.x, p.y); }

    // Flat row-major storage (y * width + x).
    const std::vector<T>& cells() const { return cells_; }

    bool operator==(const Grid& o) const {
        return width_ == o.width_ && height_ == o.height_ && cells_ == o.cells_;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int width_ = 0;
    int height_ = 0;
    T sentinel_{};
    std::vector<T> cells_;
};

} // namespace procmaps
