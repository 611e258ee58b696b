#include "ConvergenceEngine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace CEED {

namespace {

const RunConfig& validated(const RunConfig& config) {
    ConvergenceEngine::validate(config);
    return config;
}

void requireFinite(double v, const std::string& what) {
    if (!std::isfinite(v)) {
        throw ConfigurationError(what + " must be finite");
    }
}

} // namespace

// =============================================================================
// RunContext
// =============================================================================

RunContext::RunContext(std::uint64_t s,
                       const StochasticForcingGenerator::Parameters& noise_params,
                       const PhaseTracker& phase_tracker)
    : seed(s), rng(s), tracker(phase_tracker) {
    for (auto& g : noise) {
        g = StochasticForcingGenerator(noise_params);
    }
}

void RunContext::reset(std::uint64_t s) {
    seed = s;
    rng.seed(s);
    for (auto& g : noise) {
        g.reset();
    }
    tracker.reset();
}

// =============================================================================
// ConvergenceEngine
// =============================================================================

ConvergenceEngine::ConvergenceEngine(const RunConfig& cfg)
    : config(validated(cfg)),
      topology(CouplingTopology::fromConfig(cfg)),
      retention(RetentionModel::fromConfig(cfg)),
      resonance(ResonanceModel::fromConfig(cfg)),
      modulators(ModulatorSet::fromConfig(cfg)),
      classifier(cfg.phase_thresholds),
      runaway(cfg.kappa),
      e_crit(CriticalEnergySchedule::fromConfig(cfg)),
      noise_params(StochasticForcingGenerator::fromConfig(cfg)),
      inflow_cap(0.0) {
    inflow_cap = stateBound() - retention.maxRetainedEnergy();
}

void ConvergenceEngine::validate(const RunConfig& c) {
    if (c.n_steps < 0) {
        throw ConfigurationError("n_steps must be non-negative");
    }
    if (!(c.dt_days > 0.0) || !std::isfinite(c.dt_days)) {
        throw ConfigurationError("dt_days must be positive and finite");
    }
    if (!(c.retention_ceiling > 0.0) || !std::isfinite(c.retention_ceiling)) {
        throw ConfigurationError("Retention ceiling must be positive and finite");
    }
    if (!(c.safety_factor > 1.0) || !std::isfinite(c.safety_factor)) {
        throw ConfigurationError("Safety factor must be greater than 1");
    }
    const double bound = c.retention_ceiling * c.safety_factor;

    requireFinite(c.energy_floor, "energy_floor");
    if (c.energy_floor < 0.0 || c.energy_floor >= bound) {
        throw ConfigurationError("energy_floor must lie in [0, ceiling * safety_factor)");
    }
    if (!(c.zone_sum_tolerance > 0.0)) {
        throw ConfigurationError("zone_sum_tolerance must be positive");
    }

    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const std::string name = toString(static_cast<Subsystem>(i));
        const double lambda = c.decay[i];
        if (!std::isfinite(lambda) || lambda < 0.0 || lambda >= 1.0) {
            std::ostringstream oss;
            oss << "Decay lambda for " << name << " must lie in [0, 1), got " << lambda;
            throw ConfigurationError(oss.str());
        }
        const double seed = c.seed_energy[i];
        if (!std::isfinite(seed) || seed < 0.0 || seed > bound) {
            std::ostringstream oss;
            oss << "Seed energy for " << name << " must lie in [0, " << bound
                << "], got " << seed;
            throw ConfigurationError(oss.str());
        }
    }

    if (!std::isfinite(c.kappa) || c.kappa < 0.0) {
        throw ConfigurationError("kappa must be finite and non-negative");
    }
    if (!std::isfinite(c.phase_hysteresis) || c.phase_hysteresis < 0.0) {
        throw ConfigurationError("Phase hysteresis must be finite and non-negative");
    }
    if (!std::isfinite(c.modulator_scale)) {
        throw ConfigurationError("modulator_scale must be finite");
    }

    // Component constructors carry the remaining checks
    PhaseClassifier classifier(c.phase_thresholds);
    if (!(classifier.thresholds()[0] > 0.0)) {
        throw ConfigurationError("First phase threshold must be positive");
    }
    CouplingTopology::fromConfig(c);
    RetentionModel retention(RetentionModel::fromConfig(c));
    ResonanceModel resonance(ResonanceModel::fromConfig(c));
    ModulatorSet::fromConfig(c);
    StochasticForcingGenerator noise(StochasticForcingGenerator::fromConfig(c));
    CriticalEnergySchedule::fromConfig(c);

    const double headroom = bound - retention.maxRetainedEnergy();
    if (!(headroom > 0.0)) {
        std::ostringstream oss;
        oss << "No inflow headroom: ceiling * safety_factor = " << bound
            << " does not exceed alpha_max * ceiling * collapse envelope = "
            << retention.maxRetainedEnergy();
        throw ConfigurationError(oss.str());
    }
}

double ConvergenceEngine::stateBound() const {
    return config.retention_ceiling * config.safety_factor;
}

double ConvergenceEngine::limitInflow(double inflow) const {
    if (inflow > 0.0) {
        return inflow_cap * std::tanh(inflow / inflow_cap);
    }
    return inflow;
}

EnergyState ConvergenceEngine::seedState() const {
    EnergyState state;
    state.step = 0;
    state.time_days = 0.0;
    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        const bool active = config.isActive(static_cast<Subsystem>(i));
        state.active[i] = active;
        state.subsystem_energy[i] = active ? config.seed_energy[i] : 0.0;
    }
    state.zone_energy = topology.project(state.subsystem_energy, state.active);
    state.phase_occupancy.fill(0);
    state.buffer_capacity = 1.0;
    return state;
}

RunContext ConvergenceEngine::makeContext(std::uint64_t seed) const {
    return RunContext(seed, noise_params, PhaseTracker(classifier, config.phase_hysteresis));
}

void ConvergenceEngine::step(EnergyState& state, const ForcingSample& forcing,
                             const CouplingTopology& topo, RunContext& ctx) const {
    const EnergyState& previous = state;
    EnergyState next = state;
    next.step = previous.step + 1;
    next.time_days = previous.time_days + config.dt_days;

    const double t = next.time_days;
    const double xi = modulators.composite(t, forcing);
    const double p = RetentionModel::plasmaMomentum(forcing);
    // Resonance needs an external driver; an unforced system only decays
    const bool driven = !forcing.isQuiescent();

    for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
        if (!previous.active[i]) {
            next.subsystem_energy[i] = 0.0;
            continue;
        }
        const Subsystem s = static_cast<Subsystem>(i);
        const double e_prev = previous.subsystem_energy[i];

        // Collapse load: own value or the fullest zone this subsystem feeds
        double load = e_prev;
        for (size_t z = 0; z < NUM_ZONES; ++z) {
            if (topo.feedsZone(s, static_cast<Zone>(z))) {
                load = std::max(load, previous.zone_energy[z]);
            }
        }

        const double alpha = retention.retentionFactor(p, xi, load);
        const double retained = alpha * e_prev * (1.0 - config.decay[i]);

        const double f = topo.routeForcing(s, forcing);
        const double r = driven ? resonance.resonanceTerm(s, t, previous, xi) : 0.0;
        const double eps = ctx.noise[i].sample(ctx.rng);
        const double inflow = f + resonance.beta(s) * r + eps;

        // +inf inflow is capped by the limiter; -inf drains to the floor
        const double e = retained + limitInflow(inflow);
        if (std::isnan(e) || e == std::numeric_limits<double>::infinity()) {
            DivergenceRecord record;
            record.step = next.step;
            record.time_days = next.time_days;
            record.subsystem = static_cast<int>(i);
            record.value = e;
            throw NumericDivergence(record);
        }
        next.subsystem_energy[i] = std::max(config.energy_floor, e);
    }

    updateZones(previous, next, topo);
    updateBuffer(next);

    state = next;
}

void ConvergenceEngine::updateZones(const EnergyState& previous, EnergyState& next,
                                    const CouplingTopology& topo) const {
    ZoneArray zones;
    for (size_t z = 0; z < NUM_ZONES; ++z) {
        double v = previous.zone_energy[z];
        for (size_t i = 0; i < NUM_SUBSYSTEMS; ++i) {
            if (!next.active[i]) continue;
            const double delta = next.subsystem_energy[i] - previous.subsystem_energy[i];
            v += topo.weight(static_cast<Subsystem>(i), static_cast<Zone>(z)) * delta;
        }
        zones[z] = std::max(0.0, v);
    }

    zones = topo.diffuse(zones);

    double zone_sum = 0.0;
    for (auto& z : zones) {
        z = std::max(0.0, z);
        zone_sum += z;
    }

    const double total = next.totalEnergy();
    if (zone_sum > 0.0) {
        const double scale = total / zone_sum;
        for (auto& z : zones) z *= scale;
    } else {
        zones = topo.project(next.subsystem_energy, next.active);
    }

    for (size_t z = 0; z < NUM_ZONES; ++z) {
        if (!std::isfinite(zones[z])) {
            DivergenceRecord record;
            record.step = next.step;
            record.time_days = next.time_days;
            record.zone = static_cast<int>(z);
            record.value = zones[z];
            throw NumericDivergence(record);
        }
    }
    next.zone_energy = zones;
}

void ConvergenceEngine::updateBuffer(EnergyState& state) const {
    const double t_stress = classifier.thresholds()[0];
    const double total = state.totalEnergy();
    if (total > t_stress) {
        const double depletion = 0.01 * (total / t_stress) * config.dt_days;
        state.buffer_capacity = std::max(0.0, state.buffer_capacity * (1.0 - depletion));
    }
}

TrajectoryPoint ConvergenceEngine::annotate(EnergyState& state, RunContext& ctx) const {
    const double total = state.totalEnergy();

    TrajectoryPoint point;
    point.phase = ctx.tracker.update(total);
    state.phase_occupancy[index(point.phase)] += 1;
    point.critical_energy = e_crit.at(state.step, state.time_days);
    point.runaway_probability = runaway.probability(total, point.critical_energy);

    const double t_cascade = classifier.thresholds().back();
    point.distance_to_cascade = (t_cascade - total) / t_cascade;
    point.state = state;
    return point;
}

Trajectory ConvergenceEngine::run(const EnergyState& initial, int n_steps,
                                  ForcingSource& forcing, RunContext& ctx) const {
    if (n_steps < 0) {
        throw std::invalid_argument("n_steps must be non-negative");
    }
    if (!initial.allFinite()) {
        throw std::invalid_argument("Initial state contains non-finite values");
    }

    Trajectory trajectory;
    EnergyState state = initial;
    trajectory.append(annotate(state, ctx));

    for (int n = 0; n < n_steps; ++n) {
        if (ctx.cancel && ctx.cancel->cancelled()) {
            trajectory.markCancelled(state.step);
            break;
        }

        const ForcingSample sample = forcing.nextSample();
        try {
            step(state, sample, topology, ctx);
        } catch (const NumericDivergence& e) {
            trajectory.markInvalid(e.record());
            break;
        }
        trajectory.append(annotate(state, ctx));
    }

    trajectory.finalize();
    return trajectory;
}

Trajectory ConvergenceEngine::run(int n_steps, ForcingSource& forcing, std::uint64_t seed) const {
    RunContext ctx = makeContext(seed);
    return run(seedState(), n_steps, forcing, ctx);
}

} // namespace CEED
