#include "RetentionModel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace CEED {

RetentionModel::RetentionModel() : RetentionModel(Parameters()) {}

RetentionModel::RetentionModel(const Parameters& p) : params(p), envelope(1.0) {
    if (!std::isfinite(p.alpha_base) || !std::isfinite(p.alpha_max) ||
        p.alpha_base < 0.0 || p.alpha_base > p.alpha_max) {
        throw ConfigurationError("Retention requires 0 <= alpha_base <= alpha_max");
    }
    if (!(p.p_half > 0.0)) {
        throw ConfigurationError("Retention p_half must be positive");
    }
    if (!(p.ceiling > 0.0) || !std::isfinite(p.ceiling)) {
        throw ConfigurationError("Retention ceiling must be positive and finite");
    }
    if (!(p.collapse_sharpness > 0.0)) {
        throw ConfigurationError("Collapse sharpness must be positive");
    }

    const double k = p.collapse_sharpness;
    const double y_star = 0.5 * (1.0 + std::sqrt(1.0 + 2.0 / k));
    envelope = y_star * std::exp(-k * (y_star - 1.0) * (y_star - 1.0));
}

RetentionModel::Parameters RetentionModel::fromConfig(const RunConfig& config) {
    Parameters p;
    p.alpha_base = config.alpha_base;
    p.alpha_max = config.alpha_max;
    p.p_half = config.p_half;
    p.ceiling = config.retention_ceiling;
    p.collapse_sharpness = config.collapse_sharpness;
    return p;
}

double RetentionModel::plasmaMomentum(const ForcingSample& sample) {
    return sample.thermospheric_density * (1.0 + sample.geomagnetic_index / 9.0);
}

double RetentionModel::saturatedRetention(double p, double xi) const {
    if (std::isnan(p) || std::isnan(xi)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    // Reciprocal forms stay finite when p or xi overflow to +inf
    const double s = p > 0.0 ? 1.0 / (1.0 + params.p_half / p) : 0.0;
    const double a = xi > 0.0 ? 2.0 / (1.0 + 1.0 / xi) : 0.0;
    return params.alpha_base + (params.alpha_max - params.alpha_base) * s * a / 2.0;
}

double RetentionModel::collapseFactor(double e) const {
    if (e <= params.ceiling) return 1.0;
    const double x = e / params.ceiling - 1.0;
    return std::exp(-params.collapse_sharpness * x * x);
}

double RetentionModel::retentionFactor(double p, double xi, double e) const {
    return saturatedRetention(p, xi) * collapseFactor(e);
}

double RetentionModel::maxRetainedEnergy() const {
    return params.alpha_max * params.ceiling * envelope;
}

} // namespace CEED
