#ifndef MODULATORS_HPP
#define MODULATORS_HPP

#include "CEED.hpp"
#include "ForcingSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace CEED {

/**
 * @brief Multiplicative modulation of the resonance term
 *
 * Each modulator is a pure function of time (and, for debris, of the
 * sample). An observed override in ForcingSample::modulation_terms under
 * name() takes precedence for that step.
 */
class Modulator {
public:
    virtual ~Modulator() = default;

    virtual ModulatorType type() const = 0;
    std::string name() const { return configKey(type()); }

    /**
     * @brief Modulation factor at time t
     * @param t_days Simulation time in days
     * @param sample Forcing sample of the step
     */
    double factor(double t_days, const ForcingSample& sample) const;

protected:
    virtual double compute(double t_days, const ForcingSample& sample) const = 0;
};

/**
 * @brief Lunar tidal cycle
 *
 * xi = 1 + A_s sin(2 pi t / 27.3) + A_n sin(2 pi t / 206)
 */
class LunarModulator : public Modulator {
public:
    LunarModulator();
    LunarModulator(const CycleComponent& sidereal, const CycleComponent& nodal,
                   double scale = 1.0);

    ModulatorType type() const override { return ModulatorType::LUNAR; }

protected:
    double compute(double t_days, const ForcingSample& sample) const override;

private:
    CycleComponent sidereal_;
    CycleComponent nodal_;
    double scale_;
};

/**
 * @brief Planetary resonance, one cosine per configured body
 */
class PlanetaryModulator : public Modulator {
public:
    explicit PlanetaryModulator(const std::vector<PlanetaryBody>& bodies, double scale = 1.0);

    ModulatorType type() const override { return ModulatorType::PLANETARY; }
    const std::vector<PlanetaryBody>& bodies() const { return bodies_; }

protected:
    double compute(double t_days, const ForcingSample& sample) const override;

private:
    std::vector<PlanetaryBody> bodies_;
    double scale_;
};

/**
 * @brief Solar angular momentum (barycentric motion) cycles
 */
class SolarAngularMomentumModulator : public Modulator {
public:
    explicit SolarAngularMomentumModulator(const std::vector<CycleComponent>& components,
                                           double scale = 1.0);

    ModulatorType type() const override { return ModulatorType::SOLAR_AM; }

protected:
    double compute(double t_days, const ForcingSample& sample) const override;

private:
    std::vector<CycleComponent> components_;
    double scale_;
};

// xi = 1 + g D / (D + D_half), D = sample debris energy
class DebrisModulator : public Modulator {
public:
    DebrisModulator(double gain, double half_energy, double scale = 1.0);

    ModulatorType type() const override { return ModulatorType::DEBRIS; }

protected:
    double compute(double t_days, const ForcingSample& sample) const override;

private:
    double gain_;
    double half_energy_;
    double scale_;
};

/**
 * @brief Set of independently enabled modulators composed multiplicatively
 *
 * An empty set yields exactly 1.
 */
class ModulatorSet {
public:
    ModulatorSet() = default;
    ModulatorSet(ModulatorSet&&) = default;
    ModulatorSet& operator=(ModulatorSet&&) = default;
    ModulatorSet(const ModulatorSet&) = delete;
    ModulatorSet& operator=(const ModulatorSet&) = delete;

    static ModulatorSet fromConfig(const RunConfig& config);

    // Replaces an existing modulator of the same type
    void add(std::unique_ptr<Modulator> modulator);

    double composite(double t_days, const ForcingSample& sample) const;

    bool isEnabled(ModulatorType type) const;
    const Modulator* find(ModulatorType type) const;
    size_t size() const { return modulators_.size(); }
    bool empty() const { return modulators_.empty(); }

private:
    std::vector<std::unique_ptr<Modulator>> modulators_;
};

} // namespace CEED

#endif // MODULATORS_HPP
