#include "StochasticForcing.hpp"

#include <cmath>

namespace CEED {

StochasticForcingGenerator::StochasticForcingGenerator()
    : StochasticForcingGenerator(Parameters()) {}

StochasticForcingGenerator::StochasticForcingGenerator(const Parameters& p)
    : params(p), a(0.0), x_prev(0.0), y_prev(0.0), n_samples(0) {
    if (!std::isfinite(p.sigma) || p.sigma < 0.0) {
        throw ConfigurationError("Noise sigma must be finite and non-negative");
    }
    if (!(p.cutoff_period_days > 0.0)) {
        throw ConfigurationError("Noise cutoff period must be positive");
    }
    if (!(p.dt_days > 0.0)) {
        throw ConfigurationError("Noise generator requires dt_days > 0");
    }
    if (!(p.clip_sigmas > 0.0)) {
        throw ConfigurationError("Noise clip_sigmas must be positive");
    }

    const double tau = p.cutoff_period_days / (2.0 * M_PI);
    a = tau / (tau + p.dt_days);
}

StochasticForcingGenerator::Parameters
StochasticForcingGenerator::fromConfig(const RunConfig& config) {
    Parameters p;
    p.sigma = config.noise_sigma;
    p.cutoff_period_days = config.noise_cutoff_period_days;
    p.dt_days = config.dt_days;
    p.distribution = config.noise_distribution;
    p.clip_sigmas = config.noise_clip_sigmas;
    return p;
}

double StochasticForcingGenerator::draw(std::mt19937_64& rng) const {
    double raw;
    if (params.distribution == NoiseDistribution::UNIFORM) {
        const double half_width = params.sigma * std::sqrt(3.0);
        std::uniform_real_distribution<double> dist(-half_width, half_width);
        raw = dist(rng);
    } else {
        std::normal_distribution<double> dist(0.0, params.sigma);
        raw = dist(rng);
    }
    const double limit = params.clip_sigmas * params.sigma;
    return limit * std::tanh(raw / limit);
}

double StochasticForcingGenerator::sample(std::mt19937_64& rng) {
    if (params.sigma == 0.0) {
        return 0.0;
    }
    const double x = draw(rng);
    const double y = a * (y_prev + x - x_prev);
    x_prev = x;
    y_prev = y;
    ++n_samples;
    return y;
}

void StochasticForcingGenerator::reset() {
    x_prev = 0.0;
    y_prev = 0.0;
    n_samples = 0;
}

} // namespace CEED
