#include "CouplingTopology.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace CEED {

CouplingTopology::CouplingTopology(const std::vector<std::vector<double>>& zone_coupling,
                                   const std::vector<std::vector<double>>& subsystem_weights,
                                   const SubsystemArray& forcing_gain,
                                   double diffusion_rate)
    : gain_(forcing_gain), diffusion_rate_(diffusion_rate) {

    if (zone_coupling.size() != NUM_ZONES) {
        throw ConfigurationError("Zone coupling matrix must have " +
                                 std::to_string(NUM_ZONES) + " rows");
    }
    double max_row_sum = 0.0;
    for (size_t i = 0; i < NUM_ZONES; ++i) {
        if (zone_coupling[i].size() != NUM_ZONES) {
            throw ConfigurationError("Zone coupling row " + std::to_string(i) +
                                     " must have " + std::to_string(NUM_ZONES) + " columns");
        }
        double row_sum = 0.0;
        for (size_t j = 0; j < NUM_ZONES; ++j) {
            double c = zone_coupling[i][j];
            if (!std::isfinite(c) || c < 0.0) {
                std::ostringstream oss;
                oss << "Invalid zone coupling c[" << i << "][" << j << "] = " << c;
                throw ConfigurationError(oss.str());
            }
            coupling_[i][j] = c;
            if (i != j) row_sum += c;
        }
        max_row_sum = std::max(max_row_sum, row_sum);
    }

    if (!std::isfinite(diffusion_rate) || diffusion_rate < 0.0) {
        throw ConfigurationError("diffusion_rate must be finite and non-negative");
    }
    if (diffusion_rate * max_row_sum > 1.0) {
        throw ConfigurationError("diffusion_rate * max coupling row sum exceeds 1; "
                                 "zone diffusion would be unstable");
    }

    if (subsystem_weights.size() != NUM_SUBSYSTEMS) {
        throw ConfigurationError("Subsystem weights must have " +
                                 std::to_string(NUM_SUBSYSTEMS) + " rows");
    }
    for (size_t s = 0; s < NUM_SUBSYSTEMS; ++s) {
        const auto& row = subsystem_weights[s];
        const std::string name = toString(static_cast<Subsystem>(s));
        if (row.size() != NUM_ZONES) {
            throw ConfigurationError("Weights for " + name + " must have " +
                                     std::to_string(NUM_ZONES) + " entries");
        }
        double sum = 0.0;
        for (double w : row) {
            if (!std::isfinite(w) || w < 0.0) {
                throw ConfigurationError("Negative or non-finite zone weight for " + name);
            }
            sum += w;
        }
        if (!(sum > 0.0)) {
            throw ConfigurationError("Zone weights for " + name + " sum to zero");
        }
        for (size_t z = 0; z < NUM_ZONES; ++z) {
            weights_[s][z] = row[z] / sum;
        }
    }

    for (double g : gain_) {
        if (!std::isfinite(g)) {
            throw ConfigurationError("Forcing gains must be finite");
        }
    }
}

CouplingTopology CouplingTopology::fromConfig(const RunConfig& config) {
    return CouplingTopology(config.zone_coupling, config.subsystem_weights,
                            config.forcing_gain, config.diffusion_rate);
}

double CouplingTopology::coupling(Zone from, Zone to) const {
    return coupling_[index(from)][index(to)];
}

double CouplingTopology::weight(Subsystem s, Zone z) const {
    return weights_[index(s)][index(z)];
}

bool CouplingTopology::isSymmetric(double tol) const {
    for (size_t i = 0; i < NUM_ZONES; ++i) {
        for (size_t j = i + 1; j < NUM_ZONES; ++j) {
            if (std::abs(coupling_[i][j] - coupling_[j][i]) > tol) return false;
        }
    }
    return true;
}

double CouplingTopology::routeForcing(Subsystem s, const ForcingSample& sample) const {
    return gain_[index(s)] * sample.channel(s);
}

ZoneArray CouplingTopology::project(const SubsystemArray& energy,
                                    const std::array<bool, NUM_SUBSYSTEMS>& active) const {
    ZoneArray zones{};
    for (size_t s = 0; s < NUM_SUBSYSTEMS; ++s) {
        if (!active[s]) continue;
        for (size_t z = 0; z < NUM_ZONES; ++z) {
            zones[z] += weights_[s][z] * energy[s];
        }
    }
    return zones;
}

ZoneArray CouplingTopology::diffuse(const ZoneArray& zones) const {
    ZoneArray out = zones;
    for (size_t z = 0; z < NUM_ZONES; ++z) {
        double flux = 0.0;
        for (size_t j = 0; j < NUM_ZONES; ++j) {
            if (j == z) continue;
            flux += coupling_[z][j] * (zones[j] - zones[z]);
        }
        out[z] = zones[z] + diffusion_rate_ * flux;
    }
    return out;
}

} // namespace CEED
