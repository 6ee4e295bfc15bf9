#pragma once

// Charge field landmass generator
//
// Scatters signed point charges over the grid and sums a softened 1/d
// potential at every cell:
//   1) Draw numPositive + numNegative positions (positives first).
//   2) total(x,y) = sum(polarity * strength / distance), using the undamped
//      strength when a charge sits exactly on the cell.
//   3) cutoff = mean(total) * cutoffMultiplier.
//   4) Cells below the cutoff become 0; the rest keep their raw total.
//
// Step 4 is intentionally asymmetric: land cells are not normalized, so the
// result doubles as a height map. Callers that want a mask should test > 0.

#include "common.hpp"
#include "grid.hpp"
#include "mapgen_error.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace procmaps {

struct Charge {
    int x = 0;
    int y = 0;
    int polarity = 1; // +1 or -1
};

struct ChargeFieldParams {
    uint32_t seed = 0;
    int width = 200;
    int height = 200;
    int numPositive = 10;
    int numNegative = 5;
    double cutoffMultiplier = 1.0;
};

bool validateChargeFieldParams(const ChargeFieldParams& p, MapGenError* err = nullptr);

class ChargeField {
public:
    // Returns std::nullopt (and fills *err) on InvalidConfiguration.
    static std::optional<ChargeField> generate(const ChargeFieldParams& p, MapGenError* err = nullptr);

    int width() const { return field_.width(); }
    int height() const { return field_.height(); }

    // Thresholded magnitude. 0 outside the grid.
    double fieldAt(int x, int y) const { return field_.get(x, y); }
    // Field total before thresholding. 0 outside the grid.
    double rawAt(int x, int y) const { return raw_.get(x, y); }

    const Grid<double>& grid() const { return field_; }
    const Grid<double>& rawGrid() const { return raw_; }
    const std::vector<Charge>& charges() const { return charges_; }

    double chargeStrength() const { return chargeStrength_; }
    double meanField() const { return mean_; }
    double cutoff() const { return cutoff_; }

    // Cells that survived the cutoff.
    int landCount() const;

private:
    ChargeField() = default;

    double totalAt(int x, int y) const;

    std::vector<Charge> charges_;
    Grid<double> raw_;
    Grid<double> field_;
    double chargeStrength_ = 0.0;
    double mean_ = 0.0;
    double cutoff_ = 0.0;
};

} // namespace procmaps
