#ifndef RESONANCE_MODEL_HPP
#define RESONANCE_MODEL_HPP

#include "CEED.hpp"
#include "EnergyState.hpp"
#include "Modulators.hpp"

namespace CEED {

/**
 * @brief Phase-locked cross-system resonance
 *
 * For subsystem i with n active subsystems:
 *
 *   R_i = xi / (n - 1) * sum_{j != i} sqrt(E_i E_j) cos(phi_i - phi_j)
 *   phi_k(t) = 2 pi t / P_k + phi0_k
 *
 * Reads only the previous snapshot.
 */
class ResonanceModel {
public:
    struct Parameters {
        SubsystemArray beta;            // coupling coefficient per subsystem
        SubsystemArray period_days;     // oscillation period
        SubsystemArray phase_rad;       // initial phase

        Parameters() :
            beta{{0.01, 0.01, 0.01, 0.01, 0.01}},
            period_days{{4017.75, 27.27, 365.25, 23741.25, 4017.75}},
            phase_rad{{0.0, 0.0, 0.0, 0.0, 0.0}} {}
    };

    ResonanceModel();
    explicit ResonanceModel(const Parameters& params);

    static Parameters fromConfig(const RunConfig& config);

    double oscillatorPhase(Subsystem s, double t_days) const;

    // Unmodulated term
    double baseTerm(Subsystem s, double t_days, const EnergyState& previous) const;

    double resonanceTerm(Subsystem s, double t_days, const EnergyState& previous,
                         double modulation) const;
    double resonanceTerm(Subsystem s, double t_days, const EnergyState& previous,
                         const ModulatorSet& modulators, const ForcingSample& sample) const;

    double beta(Subsystem s) const { return params.beta[index(s)]; }

    const Parameters& getParameters() const { return params; }

private:
    Parameters params;
};

} // namespace CEED

#endif // RESONANCE_MODEL_HPP
