#ifndef STOCHASTIC_FORCING_HPP
#define STOCHASTIC_FORCING_HPP

#include "CEED.hpp"

#include <random>

namespace CEED {

/**
 * @brief High-pass filtered noise for one subsystem
 *
 * Each draw is softly clipped to +/- clip * sigma through tanh and then fed
 * to a one-pole high-pass filter
 *
 *   y_n = a (y_{n-1} + x_n - x_{n-1}),  a = tau / (tau + dt),
 *   tau = cutoff_period / (2 pi)
 *
 * so slow drifts are removed and only fluctuations shorter than the cutoff
 * period survive. The generator owns its filter history; one instance per
 * subsystem per run. With sigma = 0 sample() returns 0 and does not touch
 * the random engine.
 */
class StochasticForcingGenerator {
public:
    struct Parameters {
        double sigma;
        double cutoff_period_days;
        double dt_days;
        NoiseDistribution distribution;
        double clip_sigmas;

        Parameters() :
            sigma(0.5),
            cutoff_period_days(30.0),
            dt_days(1.0),
            distribution(NoiseDistribution::GAUSSIAN),
            clip_sigmas(4.0) {}
    };

    StochasticForcingGenerator();
    explicit StochasticForcingGenerator(const Parameters& params);

    static Parameters fromConfig(const RunConfig& config);

    double sample(std::mt19937_64& rng);
    void reset();

    bool hasHistory() const { return n_samples > 0; }
    double filterCoefficient() const { return a; }

    const Parameters& getParameters() const { return params; }

private:
    Parameters params;
    double a;
    double x_prev;
    double y_prev;
    long n_samples;

    double draw(std::mt19937_64& rng) const;
};

} // namespace CEED

#endif // STOCHASTIC_FORCING_HPP
