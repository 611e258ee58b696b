#ifndef CEED_HPP
#define CEED_HPP

#include <petsc.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace CEED {

// Forward declarations
class ConvergenceEngine;
class CouplingTopology;
class ForcingSource;
class MonteCarloDriver;
class Trajectory;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Energy-carrying subsystems tracked by the recurrence
 *
 * The first four are always active. DEBRIS is an extension subsystem that is
 * only tracked when the debris modulator is enabled.
 */
enum class Subsystem : int {
    SOLAR = 0,          ///< Solar radiative/particle input
    MAGNETIC,           ///< Magnetospheric storage
    ATMOSPHERIC,        ///< Thermosphere/atmosphere
    OCEANIC,            ///< Ocean circulation
    DEBRIS              ///< Orbital debris population (extension)
};

constexpr std::size_t NUM_SUBSYSTEMS = 5;
constexpr std::size_t NUM_CORE_SUBSYSTEMS = 4;

/**
 * @brief Spatial aggregation buckets for coarse zone coupling
 */
enum class Zone : int {
    POLAR = 0,
    MID_LATITUDE,
    EQUATORIAL,
    OCEANIC
};

constexpr std::size_t NUM_ZONES = 4;

/**
 * @brief Ordered qualitative system phases keyed to total energy
 */
enum class Phase : int {
    STABLE = 0,         ///< retention ~ dissipation
    STRESS,             ///< single-system accumulation
    COUPLING,           ///< cross-system echo
    AMPLIFICATION,      ///< nonlinear, nearly irreversible
    CASCADE             ///< multi-system simultaneous threshold breach
};

constexpr std::size_t NUM_PHASES = 5;
constexpr std::size_t NUM_THRESHOLDS = NUM_PHASES - 1;

enum class ModulatorType {
    LUNAR,
    PLANETARY,
    SOLAR_AM,
    DEBRIS
};

enum class RunStatus {
    VALID,
    INVALID,            ///< aborted on numeric divergence
    CANCELLED
};

enum class DistributionType {
    FIXED,
    UNIFORM,
    NORMAL              ///< (low, high) interpreted as +/- 2 sigma, clamped
};

enum class CriticalEnergyMode {
    CONSTANT,
    SEASONAL,
    TABULATED
};

enum class NoiseDistribution {
    GAUSSIAN,
    UNIFORM
};

enum class ForcingMode {
    SYNTHETIC,
    REPLAY
};

using SubsystemArray = std::array<double, NUM_SUBSYSTEMS>;
using ZoneArray = std::array<double, NUM_ZONES>;
using ThresholdArray = std::array<double, NUM_THRESHOLDS>;

inline std::size_t index(Subsystem s) { return static_cast<std::size_t>(s); }
inline std::size_t index(Zone z) { return static_cast<std::size_t>(z); }
inline std::size_t index(Phase p) { return static_cast<std::size_t>(p); }

std::string toString(Subsystem s);
std::string toString(Zone z);
std::string toString(Phase p);
std::string toString(ModulatorType m);
std::string toString(RunStatus s);

// Lower-case config keys ("solar", "mid_latitude", "solar_am", ...)
std::string configKey(Subsystem s);
std::string configKey(Zone z);
std::string configKey(ModulatorType m);

bool parseSubsystem(const std::string& name, Subsystem& out);
bool parseModulatorType(const std::string& name, ModulatorType& out);
bool parsePhase(const std::string& name, Phase& out);

// =============================================================================
// Error taxonomy
// =============================================================================

/**
 * @brief Invalid configuration (bad matrix, lambda >= 1, unordered thresholds, ...)
 *
 * Raised at construction time only; never surfaces mid-run.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Every member of an ensemble was invalid or cancelled
 */
class EnsembleFailure : public std::runtime_error {
public:
    EnsembleFailure(const std::string& what, int n_invalid, int n_cancelled)
        : std::runtime_error(what), invalid_(n_invalid), cancelled_(n_cancelled) {}

    int invalidMembers() const { return invalid_; }
    int cancelledMembers() const { return cancelled_; }

private:
    int invalid_;
    int cancelled_;
};

// =============================================================================
// Configuration structures
// =============================================================================

struct PlanetaryBody {
    std::string name;
    double amplitude = 0.0;         ///< A_i (dimensionless)
    double period_days = 1.0;       ///< P_i
    double phase_rad = 0.0;         ///< phi0_i
};

struct CycleComponent {
    double amplitude = 0.0;
    double period_days = 1.0;
    double phase_rad = 0.0;
};

/**
 * @brief Rates and trends of the built-in forcing functions
 *
 * Channel values are dimensionless proxies; trends are fractional change per
 * year. Defaults are the baseline input functions
 * (F10.7 = 180 sfu, Kp = 3, normalised density and circulation).
 */
struct SyntheticForcingParams {
    double solar_flux = 1.8;
    double solar_cycle_amplitude = 0.3;
    double solar_cycle_years = 11.0;
    double geomagnetic_index = 3.0;
    double geomagnetic_trend = 0.1;
    double thermospheric_density = 1.0;
    double density_trend = 0.05;
    double ocean_circulation = 1.0;
    double ocean_trend = 0.02;
    double debris_energy = 1.0;
    double debris_trend = 0.1;
};

/**
 * @brief Full configuration of a single convergence run
 */
struct RunConfig {
    // -------------------------------------------------------------------------
    // Time stepping and seed state
    // -------------------------------------------------------------------------
    int n_steps = 365;
    double dt_days = 1.0;
    SubsystemArray seed_energy{{45.0, 23.125, 29.5, 27.5, 0.0}};
    double energy_floor = 0.0;
    double zone_sum_tolerance = 1.0e-9;

    // -------------------------------------------------------------------------
    // Collisional decay (lambda_i), fixed per subsystem
    // -------------------------------------------------------------------------
    SubsystemArray decay{{0.05, 0.02, 0.08, 0.01, 0.10}};

    // -------------------------------------------------------------------------
    // Coupling topology
    // -------------------------------------------------------------------------
    // Rows/cols: POLAR, MID_LATITUDE, EQUATORIAL, OCEANIC
    std::vector<std::vector<double>> zone_coupling{
        {0.00, 0.30, 0.05, 0.10},
        {0.30, 0.00, 0.30, 0.20},
        {0.05, 0.30, 0.00, 0.20},
        {0.10, 0.20, 0.20, 0.00}};
    // One row per subsystem (SOLAR..DEBRIS), one column per zone
    std::vector<std::vector<double>> subsystem_weights{
        {0.20, 0.30, 0.50, 0.00},
        {0.60, 0.30, 0.10, 0.00},
        {0.25, 0.35, 0.30, 0.10},
        {0.05, 0.10, 0.15, 0.70},
        {0.10, 0.40, 0.50, 0.00}};
    SubsystemArray forcing_gain{{0.02, -0.005, 0.04, 0.01, 0.01}};
    double diffusion_rate = 0.1;

    // -------------------------------------------------------------------------
    // Retention
    // -------------------------------------------------------------------------
    double alpha_base = 1.0;
    double alpha_max = 1.1;
    double p_half = 1.0;                ///< plasma momentum at half saturation
    double retention_ceiling = 100.0;
    double safety_factor = 2.0;
    double collapse_sharpness = 4.0;

    // -------------------------------------------------------------------------
    // Resonance
    // -------------------------------------------------------------------------
    SubsystemArray resonance_beta{{0.01, 0.01, 0.01, 0.01, 0.01}};
    SubsystemArray oscillation_period_days{{4017.75, 27.27, 365.25, 23741.25, 4017.75}};
    SubsystemArray oscillation_phase_rad{{0.0, 0.0, 0.0, 0.0, 0.0}};

    // -------------------------------------------------------------------------
    // Modulators
    // -------------------------------------------------------------------------
    std::set<ModulatorType> modulators_enabled;
    double modulator_scale = 1.0;       ///< scales every modulator amplitude
    CycleComponent lunar_sidereal{0.1, 27.3, 0.0};
    CycleComponent lunar_nodal{0.05, 206.0, 0.0};
    std::vector<PlanetaryBody> planetary_bodies{
        {"venus", 0.005, 224.70, 0.0},
        {"jupiter", 0.02, 4332.59, 0.0},
        {"saturn", 0.01, 10759.22, 0.0}};
    std::vector<CycleComponent> solar_am_components{
        {0.03, 179.0 * 365.25, 0.0},
        {0.02, 60.0 * 365.25, 0.0}};
    double debris_gain = 0.05;
    double debris_half_energy = 10.0;

    // -------------------------------------------------------------------------
    // Stochastic forcing
    // -------------------------------------------------------------------------
    double noise_sigma = 0.5;
    double noise_cutoff_period_days = 30.0;
    NoiseDistribution noise_distribution = NoiseDistribution::GAUSSIAN;
    double noise_clip_sigmas = 4.0;

    // -------------------------------------------------------------------------
    // Phase classification
    // -------------------------------------------------------------------------
    std::vector<double> phase_thresholds{120.0, 150.0, 200.0, 300.0};
    double phase_hysteresis = 0.0;

    // -------------------------------------------------------------------------
    // Runaway estimation
    // -------------------------------------------------------------------------
    double kappa = 0.001;
    double e_crit = 300.0;
    CriticalEnergyMode e_crit_mode = CriticalEnergyMode::CONSTANT;
    double e_crit_seasonal_amplitude = 0.05;
    double e_crit_seasonal_period_days = 365.25;
    double e_crit_drift_per_year = 0.0;
    std::vector<double> e_crit_series;

    // -------------------------------------------------------------------------
    // Forcing source
    // -------------------------------------------------------------------------
    ForcingMode forcing_mode = ForcingMode::SYNTHETIC;
    std::string replay_file;
    SyntheticForcingParams synthetic{};

    // -------------------------------------------------------------------------
    // Output
    // -------------------------------------------------------------------------
    std::string output_prefix = "ceed_output";
    bool verbose = false;

    bool isEnabled(ModulatorType m) const {
        return modulators_enabled.count(m) > 0;
    }

    // DEBRIS is tracked only when its modulator is on
    bool isActive(Subsystem s) const {
        return s != Subsystem::DEBRIS || isEnabled(ModulatorType::DEBRIS);
    }
};

/**
 * @brief Sampling distribution for one uncertain ensemble parameter
 */
struct ParameterDistribution {
    DistributionType type = DistributionType::FIXED;
    double mean = 0.0;
    double low = 0.0;
    double high = 0.0;

    ParameterDistribution() = default;
    ParameterDistribution(DistributionType t, double m, double lo, double hi)
        : type(t), mean(m), low(lo), high(hi) {}
};

struct EnsembleConfig {
    int size = 64;
    std::uint64_t rng_seed = 20250701ULL;
    int max_concurrency = 1;            ///< worker threads per rank; 0 = hardware
    bool keep_trajectories = false;
    int progress_every = 0;             ///< 0 disables per-member progress lines

    ParameterDistribution alpha_base{DistributionType::UNIFORM, 1.0, 0.98, 1.02};
    ParameterDistribution alpha_max{DistributionType::UNIFORM, 1.1, 1.05, 1.15};
    ParameterDistribution kappa{DistributionType::NORMAL, 0.001, 0.0005, 0.0015};
    ParameterDistribution e_crit{DistributionType::NORMAL, 300.0, 270.0, 330.0};
    ParameterDistribution modulator_scale{DistributionType::UNIFORM, 1.0, 0.8, 1.2};

    // Explicit per-member seed overrides (member index -> seed)
    std::map<int, std::uint64_t> seed_overrides;
};

} // namespace CEED

#endif // CEED_HPP
