#ifndef RUNAWAY_ESTIMATOR_HPP
#define RUNAWAY_ESTIMATOR_HPP

#include "CEED.hpp"

#include <vector>

namespace CEED {

/**
 * @brief Instantaneous probability of irreversible cascade onset
 *
 * Dreicer/Connor-Hastie style estimate:
 *
 *   p = 1 - exp(-kappa (E - E_crit)^2)   for E > E_crit
 *   p = 0                                 otherwise
 */
class RunawayEstimator {
public:
    explicit RunawayEstimator(double kappa = 0.001);

    static double probability(double e_total, double e_crit, double kappa);
    double probability(double e_total, double e_crit) const;

    double kappa() const { return kappa_; }

private:
    double kappa_;
};

/**
 * @brief Per-step critical energy
 *
 * CONSTANT:  E_crit = base
 * SEASONAL:  E_crit = base (1 + amp sin(2 pi t / period)) + drift * t_years
 * TABULATED: E_crit = series[step], held at the last value past the end
 */
class CriticalEnergySchedule {
public:
    CriticalEnergySchedule();

    static CriticalEnergySchedule constant(double e_crit);
    static CriticalEnergySchedule seasonal(double base, double amplitude,
                                           double period_days, double drift_per_year);
    static CriticalEnergySchedule tabulated(const std::vector<double>& series);
    static CriticalEnergySchedule fromConfig(const RunConfig& config);

    double at(int step, double t_days) const;

    CriticalEnergyMode mode() const { return mode_; }
    double base() const { return base_; }

private:
    CriticalEnergyMode mode_;
    double base_;
    double amplitude_;
    double period_days_;
    double drift_per_year_;
    std::vector<double> series_;
};

} // namespace CEED

#endif // RUNAWAY_ESTIMATOR_HPP
