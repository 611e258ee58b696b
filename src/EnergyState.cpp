#include "EnergyState.hpp"

#include <cmath>
#include <sstream>

namespace CEED {

double EnergyState::totalEnergy() const {
    double total = 0.0;
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        if (active[i]) total += subsystem_energy[i];
    }
    return total;
}

double EnergyState::zoneTotal() const {
    double total = 0.0;
    for (double z : zone_energy) total += z;
    return total;
}

int EnergyState::activeCount() const {
    int n = 0;
    for (bool a : active) {
        if (a) ++n;
    }
    return n;
}

bool EnergyState::allFinite() const {
    for (double e : subsystem_energy) {
        if (!std::isfinite(e)) return false;
    }
    for (double z : zone_energy) {
        if (!std::isfinite(z)) return false;
    }
    return true;
}

std::string DivergenceRecord::describe() const {
    std::ostringstream oss;
    oss << "Numeric divergence at step " << step << " (t = " << time_days << " d): ";
    if (subsystem >= 0) {
        oss << "subsystem " << toString(static_cast<Subsystem>(subsystem));
    } else if (zone >= 0) {
        oss << "zone " << toString(static_cast<Zone>(zone));
    } else {
        oss << "state";
    }
    oss << " = " << value;
    return oss.str();
}

// =============================================================================
// Trajectory
// =============================================================================

void Trajectory::append(const TrajectoryPoint& point) {
    if (finalized_) {
        throw std::logic_error("Cannot append to a finalized trajectory");
    }
    points_.push_back(point);
}

void Trajectory::markInvalid(const DivergenceRecord& record) {
    status_ = RunStatus::INVALID;
    divergence_ = record;
}

void Trajectory::markCancelled(int step) {
    status_ = RunStatus::CANCELLED;
    cancelled_step_ = step;
}

void Trajectory::finalize() {
    finalized_ = true;
}

const TrajectoryPoint& Trajectory::back() const {
    if (points_.empty()) {
        throw std::out_of_range("Trajectory is empty");
    }
    return points_.back();
}

std::vector<double> Trajectory::totalEnergySeries() const {
    std::vector<double> series;
    series.reserve(points_.size());
    for (const auto& p : points_) {
        series.push_back(p.state.totalEnergy());
    }
    return series;
}

std::vector<Phase> Trajectory::phaseSeries() const {
    std::vector<Phase> series;
    series.reserve(points_.size());
    for (const auto& p : points_) {
        series.push_back(p.phase);
    }
    return series;
}

std::array<int, NUM_PHASES> Trajectory::firstCrossingSteps() const {
    std::array<int, NUM_PHASES> first;
    first.fill(-1);
    for (const auto& p : points_) {
        for (size_t k = 0; k <= index(p.phase); ++k) {
            if (first[k] < 0) first[k] = p.state.step;
        }
    }
    return first;
}

} // namespace CEED
