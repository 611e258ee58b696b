/**
 * @file test_analytical_decay.cpp
 * @brief Closed-form checks of the recurrence
 *
 * With zero plasma momentum, no modulators, no resonance and no noise the
 * recurrence reduces to E(t) = alpha_base E(t-1) (1 - lambda) + I_lim, which
 * has an exact geometric solution and a fixed point I_lim / (1 - alpha (1 - lambda)).
 */

#include <gtest/gtest.h>
#include "ConvergenceEngine.hpp"
#include <cmath>

using namespace CEED;

class AnalyticalDecayTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.noise_sigma = 0.0;
        config.resonance_beta = {{0.0, 0.0, 0.0, 0.0, 0.0}};
        config.decay = {{0.02, 0.02, 0.02, 0.02, 0.02}};
        // Keep every load far below the collapse knee
        config.retention_ceiling = 1.0e6;
        config.phase_thresholds = {1.0e3, 2.0e3, 3.0e3, 4.0e3};
        config.e_crit = 4.0e3;
    }

    RunConfig config;
};

TEST_F(AnalyticalDecayTest, PureDecayIsGeometric) {
    ConvergenceEngine engine(config);
    ConstantForcingSource forcing = ConstantForcingSource::zero();
    const int n = 100;
    Trajectory t = engine.run(n, forcing, 1);
    ASSERT_EQ(t.size(), static_cast<size_t>(n + 1));

    for (size_t k = 0; k < t.size(); ++k) {
        const double expected = std::pow(0.98, static_cast<double>(k));
        for (size_t i = 0; i < NUM_CORE_SUBSYSTEMS; ++i) {
            const double e = t.at(k).state.subsystem_energy[i];
            EXPECT_NEAR(e, config.seed_energy[i] * expected,
                        1e-12 * config.seed_energy[i]) << "step " << k;
        }
    }
}

TEST_F(AnalyticalDecayTest, TotalDecaysGeometrically) {
    ConvergenceEngine engine(config);
    ConstantForcingSource forcing = ConstantForcingSource::zero();
    Trajectory t = engine.run(50, forcing, 1);

    const double e0 = t.at(0).state.totalEnergy();
    EXPECT_NEAR(t.back().state.totalEnergy(), e0 * std::pow(0.98, 50.0), 1e-10);
    EXPECT_NEAR(t.back().state.zoneTotal(), t.back().state.totalEnergy(), 1e-8);
}

TEST_F(AnalyticalDecayTest, ReducedRetentionCompounds) {
    config.alpha_base = 0.9;
    ConvergenceEngine engine(config);
    ConstantForcingSource forcing = ConstantForcingSource::zero();
    Trajectory t = engine.run(30, forcing, 1);

    const double factor = 0.9 * 0.98;
    const double solar0 = config.seed_energy[index(Subsystem::SOLAR)];
    EXPECT_NEAR(t.back().state.energy(Subsystem::SOLAR),
                solar0 * std::pow(factor, 30.0), 1e-10);
}

TEST_F(AnalyticalDecayTest, ConstantInflowReachesFixedPoint) {
    ForcingSample sample;
    sample.solar_flux = 100.0;      // F = 0.02 * 100 = 2
    ConstantForcingSource forcing(sample, config.dt_days);

    ConvergenceEngine engine(config);
    Trajectory t = engine.run(2000, forcing, 1);
    ASSERT_TRUE(t.isValid());

    const double inflow = engine.limitInflow(2.0);
    EXPECT_LT(inflow, 2.0);
    EXPECT_NEAR(inflow, 2.0, 1e-9);

    const double fixed_point = inflow / 0.02;
    EXPECT_NEAR(t.back().state.energy(Subsystem::SOLAR), fixed_point, 1e-9);
    // Unforced subsystems decay away
    EXPECT_LT(t.back().state.energy(Subsystem::OCEANIC), 1e-12);
}

TEST_F(AnalyticalDecayTest, FloorStopsDecay) {
    config.energy_floor = 10.0;
    ConvergenceEngine engine(config);
    ConstantForcingSource forcing = ConstantForcingSource::zero();
    Trajectory t = engine.run(500, forcing, 1);

    for (size_t i = 0; i < NUM_CORE_SUBSYSTEMS; ++i) {
        EXPECT_DOUBLE_EQ(t.back().state.subsystem_energy[i], 10.0);
    }
}

TEST_F(AnalyticalDecayTest, DefaultMagnetosphereDecaysTwoPercentPerStep) {
    // Default parameters apart from the noise
    RunConfig defaults;
    defaults.noise_sigma = 0.0;
    ConvergenceEngine engine(defaults);
    ConstantForcingSource forcing = ConstantForcingSource::zero();
    Trajectory t = engine.run(40, forcing, 1);
    ASSERT_TRUE(t.isValid());

    for (size_t k = 1; k < t.size(); ++k) {
        const double prev = t.at(k - 1).state.energy(Subsystem::MAGNETIC);
        const double cur = t.at(k).state.energy(Subsystem::MAGNETIC);
        EXPECT_NEAR(cur / prev, 0.98, 1e-12) << "step " << k;
    }
}
