#ifndef FORCING_SOURCE_HPP
#define FORCING_SOURCE_HPP

#include "CEED.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace CEED {

/**
 * @brief External inputs for one time step
 *
 * modulation_terms holds observed multipliers keyed by modulator name
 * ("lunar", "planetary", "solar_am", "debris"). A present entry replaces
 * the modulator's own time function for that step.
 */
struct ForcingSample {
    double time_days = 0.0;
    double solar_flux = 0.0;
    double geomagnetic_index = 0.0;
    double thermospheric_density = 0.0;
    double ocean_circulation = 0.0;
    double debris_energy = 0.0;
    std::map<std::string, double> modulation_terms;

    // Channel feeding the given subsystem
    double channel(Subsystem s) const;

    // True when every external channel is zero and no modulation is observed
    bool isQuiescent() const;
};

/**
 * @brief Abstract provider of forcing samples
 *
 * nextSample() is called exactly once per engine step. clone() returns an
 * independent copy positioned at the start of the series so every ensemble
 * member reads its own stream.
 */
class ForcingSource {
public:
    virtual ~ForcingSource() = default;

    virtual ForcingSample nextSample() = 0;
    virtual void reset() = 0;
    virtual std::unique_ptr<ForcingSource> clone() const = 0;
};

/**
 * @brief Built-in forcing functions
 *
 * Solar flux follows an 11-year cycle; the other channels grow linearly
 * with their configured fractional trend per year. Geomagnetic index is
 * capped at 9.
 */
class SyntheticForcingSource : public ForcingSource {
public:
    SyntheticForcingSource(const SyntheticForcingParams& params, double dt_days);

    ForcingSample nextSample() override;
    void reset() override;
    std::unique_ptr<ForcingSource> clone() const override;

    // Sample at an arbitrary time without advancing
    ForcingSample evaluate(double t_days) const;

    int stepsTaken() const { return step_; }

private:
    SyntheticForcingParams params;
    double dt_days_;
    int step_;
};

/**
 * @brief Holds one sample for every step
 *
 * Used for quiescent runs and tests. Time advances by dt_days per call.
 */
class ConstantForcingSource : public ForcingSource {
public:
    ConstantForcingSource(const ForcingSample& sample, double dt_days);

    ForcingSample nextSample() override;
    void reset() override;
    std::unique_ptr<ForcingSource> clone() const override;

    static ConstantForcingSource zero(double dt_days = 1.0);

private:
    ForcingSample sample_;
    double dt_days_;
    int step_;
};

/**
 * @brief Replays a recorded series
 *
 * Throws std::out_of_range when more samples are requested than recorded.
 */
class ReplayForcingSource : public ForcingSource {
public:
    explicit ReplayForcingSource(std::vector<ForcingSample> samples);

    ForcingSample nextSample() override;
    void reset() override;
    std::unique_ptr<ForcingSource> clone() const override;

    size_t size() const { return samples_.size(); }
    size_t remaining() const { return samples_.size() - cursor_; }

private:
    std::vector<ForcingSample> samples_;
    size_t cursor_;
};

/**
 * @brief Build the source selected by RunConfig::forcing_mode
 *
 * Replay mode loads RunConfig::replay_file through TrajectoryIO.
 */
std::unique_ptr<ForcingSource> createForcingSource(const RunConfig& config);

} // namespace CEED

#endif // FORCING_SOURCE_HPP
