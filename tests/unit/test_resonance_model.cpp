/**
 * @file test_resonance_model.cpp
 * @brief Unit tests for phase-locked cross-system resonance
 */

#include <gtest/gtest.h>
#include "ResonanceModel.hpp"
#include <cmath>

using namespace CEED;

class ResonanceModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.period_days.fill(100.0);
        params.phase_rad.fill(0.0);

        state.active = {{true, true, false, false, false}};
        state.subsystem_energy = {{4.0, 9.0, 0.0, 0.0, 0.0}};
    }

    ResonanceModel::Parameters params;
    EnergyState state;
};

TEST_F(ResonanceModelTest, InPhasePairGivesGeometricMean) {
    ResonanceModel model(params);
    EXPECT_NEAR(model.baseTerm(Subsystem::SOLAR, 10.0, state), 6.0, 1e-12);
    EXPECT_NEAR(model.baseTerm(Subsystem::MAGNETIC, 10.0, state), 6.0, 1e-12);
}

TEST_F(ResonanceModelTest, AntiPhasePairIsNegative) {
    params.phase_rad[index(Subsystem::MAGNETIC)] = M_PI;
    ResonanceModel model(params);
    EXPECT_NEAR(model.baseTerm(Subsystem::SOLAR, 0.0, state), -6.0, 1e-12);
}

TEST_F(ResonanceModelTest, SingleActiveSubsystemHasNoResonance) {
    state.active = {{true, false, false, false, false}};
    ResonanceModel model(params);
    EXPECT_DOUBLE_EQ(model.baseTerm(Subsystem::SOLAR, 3.0, state), 0.0);
}

TEST_F(ResonanceModelTest, InactiveSubsystemHasNoResonance) {
    ResonanceModel model(params);
    EXPECT_DOUBLE_EQ(model.baseTerm(Subsystem::OCEANIC, 3.0, state), 0.0);
}

TEST_F(ResonanceModelTest, AveragesOverOtherActiveSubsystems) {
    state.active = {{true, true, true, false, false}};
    state.subsystem_energy = {{4.0, 9.0, 16.0, 0.0, 0.0}};
    ResonanceModel model(params);
    // (sqrt(36) + sqrt(64)) / 2
    EXPECT_NEAR(model.baseTerm(Subsystem::SOLAR, 0.0, state), 7.0, 1e-12);
}

TEST_F(ResonanceModelTest, ModulationScalesTerm) {
    ResonanceModel model(params);
    EXPECT_NEAR(model.resonanceTerm(Subsystem::SOLAR, 0.0, state, 1.5), 9.0, 1e-12);

    ModulatorSet empty;
    ForcingSample sample;
    EXPECT_NEAR(model.resonanceTerm(Subsystem::SOLAR, 0.0, state, empty, sample), 6.0, 1e-12);
}

TEST_F(ResonanceModelTest, OscillatorPhase) {
    ResonanceModel model(params);
    EXPECT_NEAR(model.oscillatorPhase(Subsystem::SOLAR, 25.0), M_PI / 2.0, 1e-14);
}

TEST_F(ResonanceModelTest, RejectsNonPositivePeriod) {
    params.period_days[index(Subsystem::OCEANIC)] = 0.0;
    EXPECT_THROW(ResonanceModel bad(params), ConfigurationError);
}
