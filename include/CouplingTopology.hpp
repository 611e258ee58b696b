#ifndef COUPLING_TOPOLOGY_HPP
#define COUPLING_TOPOLOGY_HPP

#include "CEED.hpp"
#include "ForcingSource.hpp"

#include <array>
#include <vector>

namespace CEED {

/**
 * @brief Zone coupling matrix, subsystem-to-zone weights and forcing gains
 *
 * Immutable after construction. The coupling matrix does not have to be
 * symmetric; the engine rescales zones to the subsystem total after each
 * diffusion step so asymmetric coupling cannot create or destroy energy.
 *
 * Construction throws ConfigurationError on:
 * - matrix or weight table with the wrong dimensions
 * - negative or non-finite coefficients
 * - a subsystem weight row that sums to zero
 * - diffusion_rate * (largest coupling row sum) > 1
 */
class CouplingTopology {
public:
    CouplingTopology(const std::vector<std::vector<double>>& zone_coupling,
                     const std::vector<std::vector<double>>& subsystem_weights,
                     const SubsystemArray& forcing_gain,
                     double diffusion_rate);

    static CouplingTopology fromConfig(const RunConfig& config);

    double coupling(Zone from, Zone to) const;
    double weight(Subsystem s, Zone z) const;      ///< normalised, row sums to 1
    double forcingGain(Subsystem s) const { return gain_[index(s)]; }
    double diffusionRate() const { return diffusion_rate_; }

    bool isSymmetric(double tol = 1e-12) const;
    bool feedsZone(Subsystem s, Zone z) const { return weight(s, z) > 0.0; }

    // F_i = gain_i * channel_i
    double routeForcing(Subsystem s, const ForcingSample& sample) const;

    // Distribute subsystem energies into zones through the weights
    ZoneArray project(const SubsystemArray& energy,
                      const std::array<bool, NUM_SUBSYSTEMS>& active) const;

    // One explicit diffusion step: Z_z += D * sum_j c[z][j] (Z_j - Z_z)
    ZoneArray diffuse(const ZoneArray& zones) const;

private:
    std::array<std::array<double, NUM_ZONES>, NUM_ZONES> coupling_;
    std::array<ZoneArray, NUM_SUBSYSTEMS> weights_;
    SubsystemArray gain_;
    double diffusion_rate_;
};

} // namespace CEED

#endif // COUPLING_TOPOLOGY_HPP
