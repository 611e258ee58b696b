#include "RunawayEstimator.hpp"

#include <algorithm>
#include <cmath>

namespace CEED {

RunawayEstimator::RunawayEstimator(double kappa) : kappa_(kappa) {
    if (!std::isfinite(kappa) || kappa < 0.0) {
        throw ConfigurationError("Runaway kappa must be finite and non-negative");
    }
}

double RunawayEstimator::probability(double e_total, double e_crit, double kappa) {
    if (!(e_total > e_crit)) return 0.0;
    const double d = e_total - e_crit;
    return 1.0 - std::exp(-kappa * d * d);
}

double RunawayEstimator::probability(double e_total, double e_crit) const {
    return probability(e_total, e_crit, kappa_);
}

// =============================================================================
// CriticalEnergySchedule
// =============================================================================

CriticalEnergySchedule::CriticalEnergySchedule()
    : mode_(CriticalEnergyMode::CONSTANT), base_(300.0), amplitude_(0.0),
      period_days_(365.25), drift_per_year_(0.0) {}

CriticalEnergySchedule CriticalEnergySchedule::constant(double e_crit) {
    if (!std::isfinite(e_crit)) {
        throw ConfigurationError("E_crit must be finite");
    }
    CriticalEnergySchedule s;
    s.base_ = e_crit;
    return s;
}

CriticalEnergySchedule CriticalEnergySchedule::seasonal(double base, double amplitude,
                                                        double period_days,
                                                        double drift_per_year) {
    if (!std::isfinite(base) || !std::isfinite(amplitude) || !std::isfinite(drift_per_year)) {
        throw ConfigurationError("Seasonal E_crit parameters must be finite");
    }
    if (!(period_days > 0.0)) {
        throw ConfigurationError("Seasonal E_crit period must be positive");
    }
    CriticalEnergySchedule s;
    s.mode_ = CriticalEnergyMode::SEASONAL;
    s.base_ = base;
    s.amplitude_ = amplitude;
    s.period_days_ = period_days;
    s.drift_per_year_ = drift_per_year;
    return s;
}

CriticalEnergySchedule CriticalEnergySchedule::tabulated(const std::vector<double>& series) {
    if (series.empty()) {
        throw ConfigurationError("Tabulated E_crit series is empty");
    }
    for (double v : series) {
        if (!std::isfinite(v)) {
            throw ConfigurationError("Tabulated E_crit series contains a non-finite value");
        }
    }
    CriticalEnergySchedule s;
    s.mode_ = CriticalEnergyMode::TABULATED;
    s.base_ = series.front();
    s.series_ = series;
    return s;
}

CriticalEnergySchedule CriticalEnergySchedule::fromConfig(const RunConfig& config) {
    switch (config.e_crit_mode) {
        case CriticalEnergyMode::SEASONAL:
            return seasonal(config.e_crit, config.e_crit_seasonal_amplitude,
                            config.e_crit_seasonal_period_days,
                            config.e_crit_drift_per_year);
        case CriticalEnergyMode::TABULATED:
            return tabulated(config.e_crit_series);
        case CriticalEnergyMode::CONSTANT:
            break;
    }
    return constant(config.e_crit);
}

double CriticalEnergySchedule::at(int step, double t_days) const {
    switch (mode_) {
        case CriticalEnergyMode::SEASONAL:
            return base_ * (1.0 + amplitude_ * std::sin(2.0 * M_PI * t_days / period_days_)) +
                   drift_per_year_ * t_days / 365.25;
        case CriticalEnergyMode::TABULATED: {
            const size_t i = static_cast<size_t>(std::max(0, step));
            return series_[std::min(i, series_.size() - 1)];
        }
        case CriticalEnergyMode::CONSTANT:
            break;
    }
    return base_;
}

} // namespace CEED
