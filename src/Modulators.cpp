#include "Modulators.hpp"

#include <algorithm>
#include <cmath>

namespace CEED {

namespace {

void checkPeriod(double period, const std::string& what) {
    if (!std::isfinite(period) || period <= 0.0) {
        throw ConfigurationError(what + " period must be positive");
    }
}

} // namespace

double Modulator::factor(double t_days, const ForcingSample& sample) const {
    auto it = sample.modulation_terms.find(name());
    if (it != sample.modulation_terms.end()) {
        return it->second;
    }
    return compute(t_days, sample);
}

// =============================================================================
// LunarModulator
// =============================================================================

LunarModulator::LunarModulator()
    : LunarModulator(CycleComponent{0.1, 27.3, 0.0}, CycleComponent{0.05, 206.0, 0.0}) {}

LunarModulator::LunarModulator(const CycleComponent& sidereal, const CycleComponent& nodal,
                               double scale)
    : sidereal_(sidereal), nodal_(nodal), scale_(scale) {
    checkPeriod(sidereal.period_days, "Lunar sidereal");
    checkPeriod(nodal.period_days, "Lunar nodal");
}

double LunarModulator::compute(double t_days, const ForcingSample&) const {
    double s = sidereal_.amplitude *
        std::sin(2.0 * M_PI * t_days / sidereal_.period_days + sidereal_.phase_rad);
    double n = nodal_.amplitude *
        std::sin(2.0 * M_PI * t_days / nodal_.period_days + nodal_.phase_rad);
    return 1.0 + scale_ * (s + n);
}

// =============================================================================
// PlanetaryModulator
// =============================================================================

PlanetaryModulator::PlanetaryModulator(const std::vector<PlanetaryBody>& bodies, double scale)
    : bodies_(bodies), scale_(scale) {
    for (const auto& b : bodies_) {
        checkPeriod(b.period_days, "Planetary body '" + b.name + "'");
    }
}

double PlanetaryModulator::compute(double t_days, const ForcingSample&) const {
    double sum = 0.0;
    for (const auto& b : bodies_) {
        sum += b.amplitude * std::cos(2.0 * M_PI * t_days / b.period_days + b.phase_rad);
    }
    return 1.0 + scale_ * sum;
}

// =============================================================================
// SolarAngularMomentumModulator
// =============================================================================

SolarAngularMomentumModulator::SolarAngularMomentumModulator(
    const std::vector<CycleComponent>& components, double scale)
    : components_(components), scale_(scale) {
    for (const auto& c : components_) {
        checkPeriod(c.period_days, "Solar angular momentum component");
    }
}

double SolarAngularMomentumModulator::compute(double t_days, const ForcingSample&) const {
    double sum = 0.0;
    for (const auto& c : components_) {
        sum += c.amplitude * std::sin(2.0 * M_PI * t_days / c.period_days + c.phase_rad);
    }
    return 1.0 + scale_ * sum;
}

// =============================================================================
// DebrisModulator
// =============================================================================

DebrisModulator::DebrisModulator(double gain, double half_energy, double scale)
    : gain_(gain), half_energy_(half_energy), scale_(scale) {
    if (!(half_energy > 0.0)) {
        throw ConfigurationError("Debris half-saturation energy must be positive");
    }
}

double DebrisModulator::compute(double, const ForcingSample& sample) const {
    const double d = sample.debris_energy;
    if (std::isnan(d)) return d;
    const double saturation = d > 0.0 ? 1.0 / (1.0 + half_energy_ / d) : 0.0;
    return 1.0 + scale_ * gain_ * saturation;
}

// =============================================================================
// ModulatorSet
// =============================================================================

ModulatorSet ModulatorSet::fromConfig(const RunConfig& config) {
    ModulatorSet set;
    const double scale = config.modulator_scale;

    if (config.isEnabled(ModulatorType::LUNAR)) {
        set.add(std::make_unique<LunarModulator>(config.lunar_sidereal,
                                                 config.lunar_nodal, scale));
    }
    if (config.isEnabled(ModulatorType::PLANETARY)) {
        set.add(std::make_unique<PlanetaryModulator>(config.planetary_bodies, scale));
    }
    if (config.isEnabled(ModulatorType::SOLAR_AM)) {
        set.add(std::make_unique<SolarAngularMomentumModulator>(
            config.solar_am_components, scale));
    }
    if (config.isEnabled(ModulatorType::DEBRIS)) {
        set.add(std::make_unique<DebrisModulator>(config.debris_gain,
                                                  config.debris_half_energy, scale));
    }
    return set;
}

void ModulatorSet::add(std::unique_ptr<Modulator> modulator) {
    if (!modulator) return;
    ModulatorType t = modulator->type();
    auto it = std::find_if(modulators_.begin(), modulators_.end(),
                           [t](const std::unique_ptr<Modulator>& m) { return m->type() == t; });
    if (it != modulators_.end()) {
        *it = std::move(modulator);
    } else {
        modulators_.push_back(std::move(modulator));
    }
}

double ModulatorSet::composite(double t_days, const ForcingSample& sample) const {
    double xi = 1.0;
    for (const auto& m : modulators_) {
        xi *= m->factor(t_days, sample);
    }
    return xi;
}

bool ModulatorSet::isEnabled(ModulatorType type) const {
    return find(type) != nullptr;
}

const Modulator* ModulatorSet::find(ModulatorType type) const {
    for (const auto& m : modulators_) {
        if (m->type() == type) return m.get();
    }
    return nullptr;
}

} // namespace CEED
