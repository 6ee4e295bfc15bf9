#include "charge_field.hpp"

#include "rng.hpp"

#include <cmath>
#include <sstream>

namespace procmaps {

bool validateChargeFieldParams(const ChargeFieldParams& p, MapGenError* err) {
    if (p.width <= 0 || p.height <= 0) {
        std::ostringstream ss;
        ss << "charge field dimensions must be positive (got " << p.width << "x" << p.height << ")";
        return fail(err, MapGenErrorKind::InvalidConfiguration, ss.str());
    }
    if (p.numPositive < 0 || p.numNegative < 0) {
        return fail(err, MapGenErrorKind::InvalidConfiguration, "charge counts must not be negative");
    }
    if (p.numPositive + p.numNegative == 0) {
        return fail(err, MapGenErrorKind::InvalidConfiguration, "charge field needs at least one charge");
    }
    if (!std::isfinite(p.cutoffMultiplier)) {
        return fail(err, MapGenErrorKind::InvalidConfiguration, "cutoff multiplier must be finite");
    }
    return true;
}

std::optional<ChargeField> ChargeField::generate(const ChargeFieldParams& p, MapGenError* err) {
    if (!validateChargeFieldParams(p, err)) return std::nullopt;

    ChargeField cf;
    RNG rng(hashCombine(p.seed, "CHARGE"_tag));

    const int total = p.numPositive + p.numNegative;
    cf.chargeStrength_ = (static_cast<double>(p.width + p.height) / 2.0) / std::sqrt(static_cast<double>(total));

    // Positives are drawn first; x before y for every charge.
    cf.charges_.reserve(static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) {
        Charge c;
        c.x = rng.range(0, p.width - 1);
        c.y = rng.range(0, p.height - 1);
        c.polarity = (i < p.numPositive) ? 1 : -1;
        cf.charges_.push_back(c);
    }

    cf.raw_ = Grid<double>(p.width, p.height, 0.0, 0.0);
    double sum = 0.0;
    for (int y = 0; y < p.height; ++y) {
        for (int x = 0; x < p.width; ++x) {
            const double v = cf.totalAt(x, y);
            cf.raw_.at(x, y) = v;
            sum += v;
        }
    }

    cf.mean_ = sum / static_cast<double>(cf.raw_.size());
    cf.cutoff_ = cf.mean_ * p.cutoffMultiplier;

    cf.field_ = cf.raw_;
    for (int y = 0; y < p.height; ++y) {
        for (int x = 0; x < p.width; ++x) {
            double& v = cf.field_.at(x, y);
            if (v < cf.cutoff_) v = 0.0;
        }
    }

    return cf;
}

double ChargeField::totalAt(int x, int y) const {
    double sum = 0.0;
    for (const Charge& c : charges_) {
        const double dx = static_cast<double>(x - c.x);
        const double dy = static_cast<double>(y - c.y);
        const double dist = std::sqrt(dx * dx + dy * dy);

        double contribution = chargeStrength_;
        if (dist != 0.0) contribution = chargeStrength_ / dist;

        sum += static_cast<double>(c.polarity) * contribution;
    }
    return sum;
}

int ChargeField::landCount() const {
    int n = 0;
    for (double v : field_.cells()) {
        if (v != 0.0) ++n;
    }
    return n;
}

} // namespace procmaps
