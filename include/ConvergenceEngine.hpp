#ifndef CONVERGENCE_ENGINE_HPP
#define CONVERGENCE_ENGINE_HPP

#include "CEED.hpp"
#include "EnergyState.hpp"
#include "ForcingSource.hpp"
#include "CouplingTopology.hpp"
#include "Modulators.hpp"
#include "RetentionModel.hpp"
#include "ResonanceModel.hpp"
#include "StochasticForcing.hpp"
#include "PhaseClassifier.hpp"
#include "RunawayEstimator.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <random>

namespace CEED {

/**
 * @brief Cooperative cancellation flag shared between a driver and its runs
 */
class CancellationToken {
public:
    CancellationToken() : flag(false) {}
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { flag.store(true, std::memory_order_relaxed); }
    void clear() { flag.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return flag.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag;
};

/**
 * @brief Mutable state owned by exactly one run
 *
 * Random engine, per-subsystem noise filters and the phase tracker live
 * here rather than in the engine so that independent runs never share
 * state.
 */
struct RunContext {
    RunContext(std::uint64_t seed,
               const StochasticForcingGenerator::Parameters& noise_params,
               const PhaseTracker& phase_tracker);

    void reset(std::uint64_t seed);

    std::uint64_t seed;
    std::mt19937_64 rng;
    std::array<StochasticForcingGenerator, NUM_SUBSYSTEMS> noise;
    PhaseTracker tracker;
    const CancellationToken* cancel = nullptr;
};

/**
 * @brief Coupled multi-system energy recurrence
 *
 * For each active subsystem i the step computes
 *
 *   E_i(t) = F_i + alpha_i E_i(t-1) (1 - lambda_i) + beta_i R_i + eps_i
 *
 * reading only the previous snapshot. R_i is zero for a step whose forcing
 * sample is quiescent (all channels zero). The external inflow
 * I = F + beta R + eps is passed through I_cap tanh(I / I_cap) when
 * positive, with I_cap = C S - alpha_max C M_g, so every subsystem stays in
 * [0, C S]. Zones follow the subsystem changes through the topology
 * weights, diffuse over the coupling matrix and are rescaled to the
 * subsystem total.
 *
 * The engine itself is immutable after construction and may be shared by
 * concurrent runs, each with its own RunContext.
 */
class ConvergenceEngine {
public:
    explicit ConvergenceEngine(const RunConfig& config);

    ConvergenceEngine(const ConvergenceEngine&) = delete;
    ConvergenceEngine& operator=(const ConvergenceEngine&) = delete;

    // Throws ConfigurationError describing the first problem found
    static void validate(const RunConfig& config);

    EnergyState seedState() const;
    RunContext makeContext(std::uint64_t seed) const;

    /**
     * @brief Advance one step in place
     *
     * @throws NumericDivergence if a value is non-finite after collapse
     */
    void step(EnergyState& state, const ForcingSample& forcing,
              const CouplingTopology& topology, RunContext& ctx) const;

    /**
     * @brief Run n_steps from an initial state
     *
     * The initial snapshot is the first trajectory point. Divergence is
     * recorded on the trajectory (INVALID) and stops the run; cancellation
     * is checked once per step. Exceptions from the forcing source
     * propagate.
     */
    Trajectory run(const EnergyState& initial, int n_steps,
                   ForcingSource& forcing, RunContext& ctx) const;

    // Seed state, fresh context with the given seed
    Trajectory run(int n_steps, ForcingSource& forcing, std::uint64_t seed) const;

    // Annotate a snapshot and update its phase occupancy
    TrajectoryPoint annotate(EnergyState& state, RunContext& ctx) const;

    double inflowCap() const { return inflow_cap; }
    double stateBound() const;
    double limitInflow(double inflow) const;

    const RunConfig& getConfig() const { return config; }
    const CouplingTopology& getTopology() const { return topology; }
    const RetentionModel& getRetentionModel() const { return retention; }
    const ResonanceModel& getResonanceModel() const { return resonance; }
    const ModulatorSet& getModulators() const { return modulators; }
    const PhaseClassifier& getPhaseClassifier() const { return classifier; }
    const RunawayEstimator& getRunawayEstimator() const { return runaway; }
    const CriticalEnergySchedule& getCriticalEnergySchedule() const { return e_crit; }

private:
    RunConfig config;
    CouplingTopology topology;
    RetentionModel retention;
    ResonanceModel resonance;
    ModulatorSet modulators;
    PhaseClassifier classifier;
    RunawayEstimator runaway;
    CriticalEnergySchedule e_crit;
    StochasticForcingGenerator::Parameters noise_params;
    double inflow_cap;

    void updateZones(const EnergyState& previous, EnergyState& next,
                     const CouplingTopology& topo) const;
    void updateBuffer(EnergyState& state) const;
};

} // namespace CEED

#endif // CONVERGENCE_ENGINE_HPP
