#include "ResonanceModel.hpp"

#include <algorithm>
#include <cmath>

namespace CEED {

ResonanceModel::ResonanceModel() : ResonanceModel(Parameters()) {}

ResonanceModel::ResonanceModel(const Parameters& p) : params(p) {
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string name = toString(static_cast<Subsystem>(i));
        if (!std::isfinite(p.beta[i])) {
            throw ConfigurationError("Resonance beta for " + name + " must be finite");
        }
        if (!(p.period_days[i] > 0.0) || !std::isfinite(p.period_days[i])) {
            throw ConfigurationError("Oscillation period for " + name + " must be positive");
        }
        if (!std::isfinite(p.phase_rad[i])) {
            throw ConfigurationError("Oscillation phase for " + name + " must be finite");
        }
    }
}

ResonanceModel::Parameters ResonanceModel::fromConfig(const RunConfig& config) {
    Parameters p;
    p.beta = config.resonance_beta;
    p.period_days = config.oscillation_period_days;
    p.phase_rad = config.oscillation_phase_rad;
    return p;
}

double ResonanceModel::oscillatorPhase(Subsystem s, double t_days) const {
    const size_t i = index(s);
    return 2.0 * M_PI * t_days / params.period_days[i] + params.phase_rad[i];
}

double ResonanceModel::baseTerm(Subsystem s, double t_days, const EnergyState& previous) const {
    const size_t i = index(s);
    const int n = previous.activeCount();
    if (n < 2 || !previous.active[i]) return 0.0;

    const double e_i = std::max(0.0, previous.subsystem_energy[i]);
    const double phi_i = oscillatorPhase(s, t_days);

    double sum = 0.0;
    for (size_t j = 0; j < NUM_SUBSYSTEMS; ++j) {
        if (j == i || !previous.active[j]) continue;
        const double e_j = std::max(0.0, previous.subsystem_energy[j]);
        const double phi_j = oscillatorPhase(static_cast<Subsystem>(j), t_days);
        sum += std::sqrt(e_i * e_j) * std::cos(phi_i - phi_j);
    }
    return sum / static_cast<double>(n - 1);
}

double ResonanceModel::resonanceTerm(Subsystem s, double t_days, const EnergyState& previous,
                                     double modulation) const {
    return modulation * baseTerm(s, t_days, previous);
}

double ResonanceModel::resonanceTerm(Subsystem s, double t_days, const EnergyState& previous,
                                     const ModulatorSet& modulators,
                                     const ForcingSample& sample) const {
    return resonanceTerm(s, t_days, previous, modulators.composite(t_days, sample));
}

} // namespace CEED
