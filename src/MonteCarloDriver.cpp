#include "MonteCarloDriver.hpp"
#include "WorkerPool.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace CEED {

namespace {

constexpr std::uint64_t PARAMETER_STREAM = 0x5041524D53545245ULL;
constexpr std::uint64_t NOISE_STREAM = 0x4E4F495345535452ULL;

std::uint64_t splitmix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

// Fixed part of a packed summary, followed by the total-energy series
constexpr int PACK_HEADER = 21;

void pack(const MemberSummary& m, std::vector<double>& buf) {
    buf.push_back(m.index);
    buf.push_back(static_cast<double>(m.status));
    buf.push_back(static_cast<double>(m.failure_kind));
    buf.push_back(m.failure_step);
    buf.push_back(m.failure_time_days);
    buf.push_back(m.failure_subsystem);
    buf.push_back(m.failure_zone);
    buf.push_back(m.failure_value);
    buf.push_back(static_cast<double>(m.final_phase));
    buf.push_back(m.final_runaway);
    for (int s : m.first_crossing_step) buf.push_back(s);
    buf.push_back(m.params.alpha_base);
    buf.push_back(m.params.alpha_max);
    buf.push_back(m.params.kappa);
    buf.push_back(m.params.e_crit);
    buf.push_back(m.params.modulator_scale);
    buf.push_back(static_cast<double>(m.total_energy.size()));
    buf.insert(buf.end(), m.total_energy.begin(), m.total_energy.end());
}

size_t unpack(const std::vector<double>& buf, size_t pos, MemberSummary& m) {
    m.index = static_cast<int>(buf[pos++]);
    m.status = static_cast<RunStatus>(static_cast<int>(buf[pos++]));
    m.failure_kind = static_cast<FailureKind>(static_cast<int>(buf[pos++]));
    m.failure_step = static_cast<int>(buf[pos++]);
    m.failure_time_days = buf[pos++];
    m.failure_subsystem = static_cast<int>(buf[pos++]);
    m.failure_zone = static_cast<int>(buf[pos++]);
    m.failure_value = buf[pos++];
    m.final_phase = static_cast<Phase>(static_cast<int>(buf[pos++]));
    m.final_runaway = buf[pos++];
    for (auto& s : m.first_crossing_step) s = static_cast<int>(buf[pos++]);
    m.params.alpha_base = buf[pos++];
    m.params.alpha_max = buf[pos++];
    m.params.kappa = buf[pos++];
    m.params.e_crit = buf[pos++];
    m.params.modulator_scale = buf[pos++];
    const size_t n = static_cast<size_t>(buf[pos++]);
    m.total_energy.assign(buf.begin() + pos, buf.begin() + pos + n);
    return pos + n;
}

std::string describeFailure(const MemberSummary& m) {
    std::ostringstream oss;
    switch (m.failure_kind) {
        case FailureKind::DIVERGENCE: {
            DivergenceRecord r;
            r.step = m.failure_step;
            r.time_days = m.failure_time_days;
            r.subsystem = m.failure_subsystem;
            r.zone = m.failure_zone;
            r.value = m.failure_value;
            return r.describe();
        }
        case FailureKind::FORCING:
            oss << "Forcing source failure";
            break;
        case FailureKind::CONFIGURATION:
            oss << "Configuration error";
            break;
        case FailureKind::CANCELLED:
            oss << "Cancelled at step " << m.failure_step
                << " (t = " << m.failure_time_days << " d)";
            break;
        case FailureKind::NONE:
            break;
    }
    return oss.str();
}

} // namespace

MonteCarloDriver::MonteCarloDriver(MPI_Comm c, const RunConfig& base,
                                   const EnsembleConfig& ens,
                                   const ForcingSource& prototype)
    : comm(c), rank(0), size(1), base_config(base), ensemble(ens),
      forcing_prototype(prototype.clone()) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);

    if (ensemble.max_concurrency < 0) {
        throw ConfigurationError("max_concurrency must be non-negative");
    }
    validateDistributions();
}

void MonteCarloDriver::validateDistributions() const {
    const std::pair<const char*, const ParameterDistribution*> dists[] = {
        {"alpha_base", &ensemble.alpha_base},
        {"alpha_max", &ensemble.alpha_max},
        {"kappa", &ensemble.kappa},
        {"e_crit", &ensemble.e_crit},
        {"modulator_scale", &ensemble.modulator_scale}};

    for (const auto& d : dists) {
        const ParameterDistribution& p = *d.second;
        if (!std::isfinite(p.mean) || !std::isfinite(p.low) || !std::isfinite(p.high)) {
            throw ConfigurationError(std::string("Distribution for ") + d.first +
                                     " has non-finite parameters");
        }
        if (p.type != DistributionType::FIXED && p.low > p.high) {
            throw ConfigurationError(std::string("Distribution for ") + d.first +
                                     " has low > high");
        }
    }

    // Every sample lies between these two corners, so checking both covers
    // the whole parameter box
    auto lowest = [](const ParameterDistribution& p) {
        return p.type == DistributionType::FIXED ? p.mean : p.low;
    };
    auto highest = [](const ParameterDistribution& p) {
        return p.type == DistributionType::FIXED ? p.mean : p.high;
    };

    SampledParameters lo;
    lo.alpha_base = lowest(ensemble.alpha_base);
    lo.alpha_max = lowest(ensemble.alpha_max);
    lo.kappa = lowest(ensemble.kappa);
    lo.e_crit = lowest(ensemble.e_crit);
    lo.modulator_scale = lowest(ensemble.modulator_scale);
    lo.alpha_base = std::min(lo.alpha_base, lo.alpha_max);

    SampledParameters hi;
    hi.alpha_base = highest(ensemble.alpha_base);
    hi.alpha_max = highest(ensemble.alpha_max);
    hi.kappa = highest(ensemble.kappa);
    hi.e_crit = highest(ensemble.e_crit);
    hi.modulator_scale = highest(ensemble.modulator_scale);
    hi.alpha_base = std::min(hi.alpha_base, hi.alpha_max);

    ConvergenceEngine::validate(memberConfig(lo));
    ConvergenceEngine::validate(memberConfig(hi));
}

std::uint64_t MonteCarloDriver::deriveSeed(std::uint64_t base, int index) {
    return splitmix64(base ^ splitmix64(static_cast<std::uint64_t>(index)));
}

std::uint64_t MonteCarloDriver::noiseStreamSeed(std::uint64_t member_seed) {
    return splitmix64(member_seed ^ NOISE_STREAM);
}

std::uint64_t MonteCarloDriver::parameterStreamSeed(std::uint64_t member_seed) {
    return splitmix64(member_seed ^ PARAMETER_STREAM);
}

std::uint64_t MonteCarloDriver::memberSeed(int index) const {
    auto it = ensemble.seed_overrides.find(index);
    if (it != ensemble.seed_overrides.end()) return it->second;
    return deriveSeed(ensemble.rng_seed, index);
}

SampledParameters MonteCarloDriver::sampleParameters(int index) const {
    std::mt19937_64 rng(parameterStreamSeed(memberSeed(index)));

    SampledParameters p;
    p.alpha_base = sample(ensemble.alpha_base, rng);
    p.alpha_max = sample(ensemble.alpha_max, rng);
    p.kappa = sample(ensemble.kappa, rng);
    p.e_crit = sample(ensemble.e_crit, rng);
    p.modulator_scale = sample(ensemble.modulator_scale, rng);

    p.alpha_base = std::min(p.alpha_base, p.alpha_max);
    return p;
}

RunConfig MonteCarloDriver::memberConfig(const SampledParameters& params) const {
    RunConfig cfg = base_config;
    cfg.alpha_base = params.alpha_base;
    cfg.alpha_max = params.alpha_max;
    cfg.kappa = params.kappa;
    cfg.e_crit = params.e_crit;
    cfg.modulator_scale = params.modulator_scale;
    return cfg;
}

MemberSummary MonteCarloDriver::runMember(int index, Trajectory* trajectory) const {
    MemberSummary m;
    m.index = index;
    m.seed = memberSeed(index);
    m.params = sampleParameters(index);
    m.first_crossing_step.fill(-1);

    if (cancel && cancel->cancelled()) {
        m.status = RunStatus::CANCELLED;
        m.failure_kind = FailureKind::CANCELLED;
        m.failure_step = 0;
        m.failure_cause = describeFailure(m);
        return m;
    }

    Trajectory traj;
    try {
        ConvergenceEngine engine(memberConfig(m.params));
        RunContext ctx = engine.makeContext(noiseStreamSeed(m.seed));
        ctx.cancel = cancel;
        std::unique_ptr<ForcingSource> forcing = forcing_prototype->clone();
        traj = engine.run(engine.seedState(), base_config.n_steps, *forcing, ctx);
    } catch (const ConfigurationError& e) {
        m.status = RunStatus::INVALID;
        m.failure_kind = FailureKind::CONFIGURATION;
        m.failure_cause = std::string("Configuration error: ") + e.what();
        return m;
    } catch (const std::exception& e) {
        m.status = RunStatus::INVALID;
        m.failure_kind = FailureKind::FORCING;
        m.failure_cause = std::string("Forcing source failure: ") + e.what();
        return m;
    }

    m.status = traj.status();
    if (m.status == RunStatus::INVALID) {
        const DivergenceRecord& r = traj.divergence();
        m.failure_kind = FailureKind::DIVERGENCE;
        m.failure_step = r.step;
        m.failure_time_days = r.time_days;
        m.failure_subsystem = r.subsystem;
        m.failure_zone = r.zone;
        m.failure_value = r.value;
    } else if (m.status == RunStatus::CANCELLED) {
        m.failure_kind = FailureKind::CANCELLED;
        m.failure_step = traj.cancelledAtStep();
        m.failure_time_days = m.failure_step * base_config.dt_days;
    }
    m.failure_cause = describeFailure(m);

    m.total_energy = traj.totalEnergySeries();
    m.first_crossing_step = traj.firstCrossingSteps();
    if (!traj.empty()) {
        m.final_phase = traj.back().phase;
        m.final_runaway = traj.back().runaway_probability;
    }

    if (trajectory) {
        *trajectory = std::move(traj);
    }
    return m;
}

PetscErrorCode MonteCarloDriver::runEnsemble(int n_members, EnsembleResult& result) {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    if (n_members < 1) {
        throw ConfigurationError("Ensemble needs at least one member");
    }

    result = EnsembleResult();

    std::vector<int> local_indices;
    for (int m = rank; m < n_members; m += size) {
        local_indices.push_back(m);
    }

    const double t_start = MPI_Wtime();
    ierr = PetscPrintf(comm, "Running ensemble: %d members on %d rank(s)\n",
                       n_members, size); CHKERRQ(ierr);

    std::vector<MemberSummary> local(local_indices.size());
    std::vector<Trajectory> local_traj(ensemble.keep_trajectories ? local_indices.size() : 0);

    std::mutex progress_mutex;
    int completed = 0;
    auto runOne = [&](size_t k) {
        Trajectory* out = ensemble.keep_trajectories ? &local_traj[k] : nullptr;
        local[k] = runMember(local_indices[k], out);

        if (ensemble.progress_every > 0) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++completed;
            if (completed % ensemble.progress_every == 0 ||
                completed == static_cast<int>(local.size())) {
                PetscPrintf(PETSC_COMM_SELF, "  [rank %d] %d/%d members done\n",
                            rank, completed, static_cast<int>(local.size()));
            }
        }
    };

    size_t threads = ensemble.max_concurrency == 0
        ? std::max<size_t>(1, std::thread::hardware_concurrency())
        : static_cast<size_t>(ensemble.max_concurrency);
    threads = std::min(threads, local.size());

    if (threads <= 1) {
        for (size_t k = 0; k < local.size(); ++k) runOne(k);
    } else {
        WorkerPool pool(threads);
        for (size_t k = 0; k < local.size(); ++k) {
            pool.enqueue([&runOne, k] { runOne(k); });
        }
        pool.waitAll();
    }

    std::vector<MemberSummary> all;
    ierr = gatherSummaries(local, all); CHKERRQ(ierr);

    aggregate(std::move(all), result);

    if (ensemble.keep_trajectories) {
        for (size_t k = 0; k < local_indices.size(); ++k) {
            result.trajectories[local_indices[k]] = std::move(local_traj[k]);
        }
    }

    const double elapsed = MPI_Wtime() - t_start;
    ierr = PetscPrintf(comm, "Ensemble complete: %d valid, %d invalid, %d cancelled (%.2f s)\n",
                       result.n_valid, result.n_invalid, result.n_cancelled,
                       elapsed); CHKERRQ(ierr);

    if (base_config.verbose) {
        for (const auto& m : result.members) {
            if (m.status != RunStatus::VALID) {
                ierr = PetscPrintf(comm, "  member %d: %s (%s)\n", m.index,
                                   toString(m.status).c_str(),
                                   m.failure_cause.c_str()); CHKERRQ(ierr);
            }
        }
    }

    if (result.n_valid == 0) {
        throw EnsembleFailure("No ensemble member completed: " +
                              std::to_string(result.n_invalid) + " invalid, " +
                              std::to_string(result.n_cancelled) + " cancelled",
                              result.n_invalid, result.n_cancelled);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode MonteCarloDriver::gatherSummaries(const std::vector<MemberSummary>& local,
                                                 std::vector<MemberSummary>& all) const {
    PetscErrorCode ierr;
    PetscFunctionBeginUser;

    std::vector<double> send;
    for (const auto& m : local) pack(m, send);

    // Failure causes travel separately, NUL-terminated in local order
    std::vector<char> send_text;
    for (const auto& m : local) {
        send_text.insert(send_text.end(), m.failure_cause.begin(), m.failure_cause.end());
        send_text.push_back('\0');
    }

    PetscMPIInt send_count = static_cast<PetscMPIInt>(send.size());
    std::vector<PetscMPIInt> counts(size, 0);
    ierr = MPI_Allgather(&send_count, 1, MPI_INT, counts.data(), 1, MPI_INT, comm);
    CHKERRMPI(ierr);

    std::vector<PetscMPIInt> displs(size, 0);
    int total = 0;
    for (int r = 0; r < size; ++r) {
        displs[r] = total;
        total += counts[r];
    }

    std::vector<double> recv(total);
    ierr = MPI_Allgatherv(send.data(), send_count, MPI_DOUBLE,
                          recv.data(), counts.data(), displs.data(), MPI_DOUBLE, comm);
    CHKERRMPI(ierr);

    PetscMPIInt send_chars = static_cast<PetscMPIInt>(send_text.size());
    std::vector<PetscMPIInt> char_counts(size, 0);
    ierr = MPI_Allgather(&send_chars, 1, MPI_INT, char_counts.data(), 1, MPI_INT, comm);
    CHKERRMPI(ierr);

    std::vector<PetscMPIInt> char_displs(size, 0);
    int total_chars = 0;
    for (int r = 0; r < size; ++r) {
        char_displs[r] = total_chars;
        total_chars += char_counts[r];
    }

    std::vector<char> recv_text(total_chars);
    ierr = MPI_Allgatherv(send_text.data(), send_chars, MPI_CHAR,
                          recv_text.data(), char_counts.data(), char_displs.data(),
                          MPI_CHAR, comm);
    CHKERRMPI(ierr);

    // Both buffers are rank-ordered with the same member order per rank
    all.clear();
    size_t pos = 0;
    size_t text_pos = 0;
    while (pos + PACK_HEADER <= recv.size()) {
        MemberSummary m;
        pos = unpack(recv, pos, m);
        m.seed = memberSeed(m.index);
        if (text_pos < recv_text.size()) {
            m.failure_cause.assign(recv_text.data() + text_pos);
            text_pos += m.failure_cause.size() + 1;
        } else {
            m.failure_cause = describeFailure(m);
        }
        all.push_back(std::move(m));
    }

    std::sort(all.begin(), all.end(),
              [](const MemberSummary& a, const MemberSummary& b) { return a.index < b.index; });

    PetscFunctionReturn(0);
}

void MonteCarloDriver::aggregate(std::vector<MemberSummary> members,
                                 EnsembleResult& result) const {
    result.n_members = static_cast<int>(members.size());
    result.n_steps = base_config.n_steps;
    result.dt_days = base_config.dt_days;
    for (size_t k = 0; k < NUM_THRESHOLDS; ++k) {
        result.thresholds[k] = base_config.phase_thresholds[k];
    }

    std::vector<const MemberSummary*> valid;
    for (const auto& m : members) {
        switch (m.status) {
            case RunStatus::VALID:
                ++result.n_valid;
                valid.push_back(&m);
                break;
            case RunStatus::INVALID:
                ++result.n_invalid;
                break;
            case RunStatus::CANCELLED:
                ++result.n_cancelled;
                break;
        }
    }

    if (!valid.empty()) {
        const double n_valid = static_cast<double>(valid.size());

        // Percentile bands of total energy per step
        const size_t n_points = valid.front()->total_energy.size();
        result.total_energy_bands.resize(n_points);
        std::vector<double> values(valid.size());
        for (size_t s = 0; s < n_points; ++s) {
            for (size_t k = 0; k < valid.size(); ++k) {
                values[k] = valid[k]->total_energy[s];
            }
            result.total_energy_bands[s] = EnsembleStatistics::band(values);
        }

        // First-crossing time per phase
        for (size_t p = 0; p < NUM_PHASES; ++p) {
            std::vector<double> times;
            for (const auto* m : valid) {
                if (m->first_crossing_step[p] >= 0) {
                    times.push_back(m->first_crossing_step[p] * base_config.dt_days);
                }
            }
            PhaseCrossingStatistics& c = result.phase_crossing[p];
            c.count = static_cast<int>(times.size());
            c.fraction_reached = times.size() / n_valid;
            if (!times.empty()) {
                std::sort(times.begin(), times.end());
                c.mean_days = EnsembleStatistics::mean(times);
                c.p10_days = EnsembleStatistics::percentile(times, 0.10);
                c.p50_days = EnsembleStatistics::percentile(times, 0.50);
                c.p90_days = EnsembleStatistics::percentile(times, 0.90);
            }
        }

        std::vector<double> final_runaway;
        std::array<int, NUM_THRESHOLDS> exceed{};
        for (const auto* m : valid) {
            result.final_phase_counts[index(m->final_phase)] += 1;
            final_runaway.push_back(m->final_runaway);
            const double final_total = m->total_energy.empty() ? 0.0 : m->total_energy.back();
            for (size_t k = 0; k < NUM_THRESHOLDS; ++k) {
                if (final_total >= result.thresholds[k]) ++exceed[k];
            }
        }
        for (size_t k = 0; k < NUM_THRESHOLDS; ++k) {
            result.threshold_exceedance[k] = exceed[k] / n_valid;
        }

        result.final_runaway = EnsembleStatistics::summarize(final_runaway);
        result.runaway_histogram = EnsembleStatistics::histogram(final_runaway, 0.0, 1.0, 10);
    } else {
        result.runaway_histogram.assign(10, 0);
    }

    result.members = std::move(members);
}

} // namespace CEED
