#ifndef RETENTION_MODEL_HPP
#define RETENTION_MODEL_HPP

#include "CEED.hpp"
#include "ForcingSource.hpp"

namespace CEED {

/**
 * @brief Saturating retention factor with continuous collapse above a ceiling
 *
 * The retention multiplier alpha grows with plasma momentum p and with the
 * coupling geometry input xi (the modulator product), saturating at
 * alpha_max:
 *
 *   alpha(p, xi) = alpha_base + (alpha_max - alpha_base) * s(p) * a(xi) / 2
 *   s(p)  = p / (p + p_half)
 *   a(xi) = 2 xi / (1 + xi)
 *
 * Above the retention ceiling C the multiplier is attenuated by a Gaussian
 * falloff g(e) = exp(-k (e/C - 1)^2), which is C1 at the ceiling and
 * strictly decreasing beyond it. The product e * g(e) is bounded by
 * C * M_g, the collapse envelope, which is what keeps retained energy
 * finite under arbitrarily large loads.
 */
class RetentionModel {
public:
    struct Parameters {
        double alpha_base;          // Retention at zero momentum
        double alpha_max;           // Saturated retention
        double p_half;              // Momentum at half saturation
        double ceiling;             // C
        double collapse_sharpness;  // k

        Parameters() :
            alpha_base(1.0),
            alpha_max(1.1),
            p_half(1.0),
            ceiling(100.0),
            collapse_sharpness(4.0) {}
    };

    RetentionModel();
    explicit RetentionModel(const Parameters& params);

    static Parameters fromConfig(const RunConfig& config);

    // p = density * (1 + Kp / 9)
    static double plasmaMomentum(const ForcingSample& sample);

    double saturatedRetention(double p, double xi) const;
    double collapseFactor(double e) const;
    double retentionFactor(double p, double xi, double e) const;

    /**
     * @brief sup over y >= 0 of y * g(y C) / C
     *
     * Attained at y* = (1 + sqrt(1 + 2/k)) / 2.
     */
    double collapseEnvelope() const { return envelope; }

    // Upper bound of alpha * e * g(e) over all loads
    double maxRetainedEnergy() const;

    const Parameters& getParameters() const { return params; }

private:
    Parameters params;
    double envelope;
};

} // namespace CEED

#endif // RETENTION_MODEL_HPP
