#include "ForcingSource.hpp"
#include "TrajectoryIO.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace CEED {

namespace {
constexpr double DAYS_PER_YEAR = 365.25;
constexpr double MAX_KP = 9.0;
}

double ForcingSample::channel(Subsystem s) const {
    switch (s) {
        case Subsystem::SOLAR:       return solar_flux;
        case Subsystem::MAGNETIC:    return geomagnetic_index;
        case Subsystem::ATMOSPHERIC: return thermospheric_density;
        case Subsystem::OCEANIC:     return ocean_circulation;
        case Subsystem::DEBRIS:      return debris_energy;
    }
    return 0.0;
}

bool ForcingSample::isQuiescent() const {
    return solar_flux == 0.0 && geomagnetic_index == 0.0 &&
           thermospheric_density == 0.0 && ocean_circulation == 0.0 &&
           debris_energy == 0.0 && modulation_terms.empty();
}

// =============================================================================
// SyntheticForcingSource
// =============================================================================

SyntheticForcingSource::SyntheticForcingSource(const SyntheticForcingParams& p,
                                               double dt_days)
    : params(p), dt_days_(dt_days), step_(0) {
    if (!(dt_days > 0.0)) {
        throw ConfigurationError("Synthetic forcing requires dt_days > 0");
    }
    if (!(p.solar_cycle_years > 0.0)) {
        throw ConfigurationError("Synthetic forcing requires solar_cycle_years > 0");
    }
}

ForcingSample SyntheticForcingSource::evaluate(double t_days) const {
    const double years = t_days / DAYS_PER_YEAR;

    ForcingSample s;
    s.time_days = t_days;
    s.solar_flux = params.solar_flux *
        (1.0 + params.solar_cycle_amplitude *
               std::cos(2.0 * M_PI * years / params.solar_cycle_years));
    s.geomagnetic_index = std::min(MAX_KP,
        params.geomagnetic_index * (1.0 + params.geomagnetic_trend * years));
    s.thermospheric_density = params.thermospheric_density *
        (1.0 + params.density_trend * years);
    s.ocean_circulation = params.ocean_circulation *
        (1.0 + params.ocean_trend * years);
    s.debris_energy = params.debris_energy * (1.0 + params.debris_trend * years);
    return s;
}

ForcingSample SyntheticForcingSource::nextSample() {
    ++step_;
    return evaluate(step_ * dt_days_);
}

void SyntheticForcingSource::reset() {
    step_ = 0;
}

std::unique_ptr<ForcingSource> SyntheticForcingSource::clone() const {
    return std::make_unique<SyntheticForcingSource>(params, dt_days_);
}

// =============================================================================
// ConstantForcingSource
// =============================================================================

ConstantForcingSource::ConstantForcingSource(const ForcingSample& sample, double dt_days)
    : sample_(sample), dt_days_(dt_days), step_(0) {}

ForcingSample ConstantForcingSource::nextSample() {
    ++step_;
    ForcingSample s = sample_;
    s.time_days = step_ * dt_days_;
    return s;
}

void ConstantForcingSource::reset() {
    step_ = 0;
}

std::unique_ptr<ForcingSource> ConstantForcingSource::clone() const {
    return std::make_unique<ConstantForcingSource>(sample_, dt_days_);
}

ConstantForcingSource ConstantForcingSource::zero(double dt_days) {
    return ConstantForcingSource(ForcingSample(), dt_days);
}

// =============================================================================
// ReplayForcingSource
// =============================================================================

ReplayForcingSource::ReplayForcingSource(std::vector<ForcingSample> samples)
    : samples_(std::move(samples)), cursor_(0) {}

ForcingSample ReplayForcingSource::nextSample() {
    if (cursor_ >= samples_.size()) {
        throw std::out_of_range("Replay forcing exhausted after " +
                                std::to_string(samples_.size()) + " samples");
    }
    return samples_[cursor_++];
}

void ReplayForcingSource::reset() {
    cursor_ = 0;
}

std::unique_ptr<ForcingSource> ReplayForcingSource::clone() const {
    return std::make_unique<ReplayForcingSource>(samples_);
}

std::unique_ptr<ForcingSource> createForcingSource(const RunConfig& config) {
    if (config.forcing_mode == ForcingMode::REPLAY) {
        if (config.replay_file.empty()) {
            throw ConfigurationError("Replay forcing requires [FORCING] replay_file");
        }
        return std::make_unique<ReplayForcingSource>(
            TrajectoryIO::loadForcingSeries(config.replay_file));
    }
    return std::make_unique<SyntheticForcingSource>(config.synthetic, config.dt_days);
}

} // namespace CEED
