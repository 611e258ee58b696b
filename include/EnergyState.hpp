#ifndef ENERGY_STATE_HPP
#define ENERGY_STATE_HPP

#include "CEED.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace CEED {

/**
 * @brief Snapshot of all tracked energies at one time step
 *
 * Subsystem and zone values are non-negative once retention collapse has
 * been applied. The zone total tracks the active subsystem total.
 */
struct EnergyState {
    int step = 0;
    double time_days = 0.0;

    SubsystemArray subsystem_energy{};
    std::array<bool, NUM_SUBSYSTEMS> active{};
    ZoneArray zone_energy{};

    // Cumulative steps spent in each phase, current step included
    std::array<int, NUM_PHASES> phase_occupancy{};

    // Diagnostic buffer, 1 = fully intact, 0 = exhausted
    double buffer_capacity = 1.0;

    double energy(Subsystem s) const { return subsystem_energy[index(s)]; }
    double zone(Zone z) const { return zone_energy[index(z)]; }
    bool isActive(Subsystem s) const { return active[index(s)]; }

    double totalEnergy() const;
    double zoneTotal() const;
    int activeCount() const;
    bool allFinite() const;
};

/**
 * @brief Where and why a run diverged
 */
struct DivergenceRecord {
    int step = -1;
    int subsystem = -1;             ///< Subsystem index, or -1
    int zone = -1;                  ///< Zone index, or -1
    double value = 0.0;
    double time_days = 0.0;

    std::string describe() const;
};

/**
 * @brief Raised inside a step when a value stays non-finite after collapse
 */
class NumericDivergence : public std::runtime_error {
public:
    explicit NumericDivergence(const DivergenceRecord& record)
        : std::runtime_error(record.describe()), record_(record) {}

    const DivergenceRecord& record() const { return record_; }

private:
    DivergenceRecord record_;
};

/**
 * @brief Annotated snapshot appended to a trajectory
 */
struct TrajectoryPoint {
    EnergyState state;
    Phase phase = Phase::STABLE;
    double runaway_probability = 0.0;
    double critical_energy = 0.0;
    double distance_to_cascade = 1.0;
};

/**
 * @brief Append-only sequence of annotated snapshots for one run
 *
 * The seed snapshot is the first point. Once finalized no further points
 * may be added.
 */
class Trajectory {
public:
    Trajectory() = default;

    void append(const TrajectoryPoint& point);
    void markInvalid(const DivergenceRecord& record);
    void markCancelled(int step);
    void finalize();

    const std::vector<TrajectoryPoint>& points() const { return points_; }
    const TrajectoryPoint& at(size_t i) const { return points_.at(i); }
    const TrajectoryPoint& back() const;
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    RunStatus status() const { return status_; }
    bool isValid() const { return status_ == RunStatus::VALID; }
    bool isFinalized() const { return finalized_; }
    int cancelledAtStep() const { return cancelled_step_; }
    const DivergenceRecord& divergence() const { return divergence_; }

    std::vector<double> totalEnergySeries() const;
    std::vector<Phase> phaseSeries() const;

    // First step at which each phase (or higher) was reached, -1 if never
    std::array<int, NUM_PHASES> firstCrossingSteps() const;

private:
    std::vector<TrajectoryPoint> points_;
    RunStatus status_ = RunStatus::VALID;
    DivergenceRecord divergence_;
    int cancelled_step_ = -1;
    bool finalized_ = false;
};

} // namespace CEED

#endif // ENERGY_STATE_HPP
