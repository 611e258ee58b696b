#ifndef MONTE_CARLO_DRIVER_HPP
#define MONTE_CARLO_DRIVER_HPP

#include "CEED.hpp"
#include "ConvergenceEngine.hpp"
#include "EnergyState.hpp"
#include "EnsembleStatistics.hpp"
#include "ForcingSource.hpp"

#include <petsc.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace CEED {

/**
 * @brief Parameters drawn for one ensemble member
 */
struct SampledParameters {
    double alpha_base = 1.0;
    double alpha_max = 1.1;
    double kappa = 0.001;
    double e_crit = 300.0;
    double modulator_scale = 1.0;
};

enum class FailureKind : int {
    NONE = 0,
    DIVERGENCE,
    FORCING,
    CONFIGURATION,
    CANCELLED
};

/**
 * @brief Outcome of one member, exchanged between ranks
 */
struct MemberSummary {
    int index = -1;
    std::uint64_t seed = 0;
    RunStatus status = RunStatus::VALID;

    FailureKind failure_kind = FailureKind::NONE;
    int failure_step = -1;
    double failure_time_days = 0.0;
    int failure_subsystem = -1;
    int failure_zone = -1;
    double failure_value = 0.0;
    std::string failure_cause;                          // exchanged verbatim across ranks

    SampledParameters params;
    std::vector<double> total_energy;                   // one per trajectory point
    std::array<int, NUM_PHASES> first_crossing_step{};  // -1 if never reached
    Phase final_phase = Phase::STABLE;
    double final_runaway = 0.0;
};

struct PhaseCrossingStatistics {
    int count = 0;                  // valid members that reached the phase
    double fraction_reached = 0.0;
    double mean_days = 0.0;
    double p10_days = 0.0;
    double p50_days = 0.0;
    double p90_days = 0.0;
};

/**
 * @brief Aggregated ensemble outcome
 *
 * Statistics are computed over VALID members only. Trajectories are kept
 * only for members run on the calling rank and only when requested.
 */
struct EnsembleResult {
    int n_members = 0;
    int n_valid = 0;
    int n_invalid = 0;
    int n_cancelled = 0;
    int n_steps = 0;
    double dt_days = 1.0;

    std::vector<PercentileBand> total_energy_bands;     // index = step
    std::array<PhaseCrossingStatistics, NUM_PHASES> phase_crossing{};
    std::array<int, NUM_PHASES> final_phase_counts{};

    SummaryStatistics final_runaway;
    std::vector<int> runaway_histogram;                 // 10 bins over [0, 1]

    ThresholdArray thresholds{};
    ThresholdArray threshold_exceedance{};

    std::vector<MemberSummary> members;                 // sorted by index
    std::map<int, Trajectory> trajectories;
};

/**
 * @brief Runs independent ensemble members across MPI ranks and threads
 *
 * Members are assigned round-robin to ranks; each rank runs its members on
 * a WorkerPool bounded by EnsembleConfig::max_concurrency. Each member gets
 * its own engine, context, forcing-source clone and trajectory, so one
 * member's seed or parameters never influence another. Summaries are
 * exchanged with MPI_Allgatherv so every rank ends with the same result.
 */
class MonteCarloDriver {
public:
    MonteCarloDriver(MPI_Comm comm, const RunConfig& base, const EnsembleConfig& ensemble,
                     const ForcingSource& forcing_prototype);

    /**
     * @brief Run n_members and aggregate
     *
     * @throws EnsembleFailure if no member finished VALID
     * @throws ConfigurationError if n_members < 1
     */
    PetscErrorCode runEnsemble(int n_members, EnsembleResult& result);

    // Run a single member locally; never throws for member-level failures
    MemberSummary runMember(int index, Trajectory* trajectory = nullptr) const;

    std::uint64_t memberSeed(int index) const;
    SampledParameters sampleParameters(int index) const;
    RunConfig memberConfig(const SampledParameters& params) const;

    void setCancellationToken(const CancellationToken* token) { cancel = token; }

    // splitmix64 mix of (base, index)
    static std::uint64_t deriveSeed(std::uint64_t base, int index);
    static std::uint64_t noiseStreamSeed(std::uint64_t member_seed);
    static std::uint64_t parameterStreamSeed(std::uint64_t member_seed);

    // Uniform, clamped normal (sigma = (high - low) / 4) or fixed draw
    template<typename RNG>
    static double sample(const ParameterDistribution& dist, RNG& rng);

    const RunConfig& getBaseConfig() const { return base_config; }
    const EnsembleConfig& getEnsembleConfig() const { return ensemble; }

private:
    MPI_Comm comm;
    int rank;
    int size;
    RunConfig base_config;
    EnsembleConfig ensemble;
    std::unique_ptr<ForcingSource> forcing_prototype;
    const CancellationToken* cancel = nullptr;

    void validateDistributions() const;

    PetscErrorCode gatherSummaries(const std::vector<MemberSummary>& local,
                                   std::vector<MemberSummary>& all) const;
    void aggregate(std::vector<MemberSummary> members, EnsembleResult& result) const;
};

template<typename RNG>
double MonteCarloDriver::sample(const ParameterDistribution& dist, RNG& rng) {
    switch (dist.type) {
        case DistributionType::UNIFORM: {
            if (!(dist.high > dist.low)) return dist.low;
            std::uniform_real_distribution<double> u(dist.low, dist.high);
            return u(rng);
        }
        case DistributionType::NORMAL: {
            const double sigma = (dist.high - dist.low) / 4.0;
            if (!(sigma > 0.0)) return dist.mean;
            std::normal_distribution<double> n(dist.mean, sigma);
            return std::min(dist.high, std::max(dist.low, n(rng)));
        }
        case DistributionType::FIXED:
            break;
    }
    return dist.mean;
}

} // namespace CEED

#endif // MONTE_CARLO_DRIVER_HPP
