/**
 * @file test_modulators.cpp
 * @brief Unit tests for lunar, planetary, solar angular momentum and debris modulators
 */

#include <gtest/gtest.h>
#include "Modulators.hpp"
#include <cmath>

using namespace CEED;

TEST(ModulatorTest, LunarIsOneAtOrigin) {
    LunarModulator lunar;
    ForcingSample sample;
    EXPECT_DOUBLE_EQ(lunar.factor(0.0, sample), 1.0);
}

TEST(ModulatorTest, LunarPeaksNearQuarterSiderealPeriod) {
    LunarModulator lunar;
    ForcingSample sample;
    // Sidereal term at its maximum, nodal term small and positive
    EXPECT_NEAR(lunar.factor(27.3 / 4.0, sample), 1.1, 0.02);
    EXPECT_GT(lunar.factor(27.3 / 4.0, sample), 1.1);
}

TEST(ModulatorTest, LunarIsPeriodicInSiderealTerm) {
    CycleComponent sidereal{0.1, 27.3, 0.0};
    CycleComponent nodal{0.0, 206.0, 0.0};
    LunarModulator lunar(sidereal, nodal);
    ForcingSample sample;
    EXPECT_NEAR(lunar.factor(5.0, sample), lunar.factor(5.0 + 27.3, sample), 1e-12);
}

TEST(ModulatorTest, ObservedOverrideTakesPrecedence) {
    LunarModulator lunar;
    ForcingSample sample;
    sample.modulation_terms["lunar"] = 0.7;
    EXPECT_DOUBLE_EQ(lunar.factor(6.825, sample), 0.7);

    // An override for another modulator is ignored
    ForcingSample other;
    other.modulation_terms["planetary"] = 0.7;
    EXPECT_DOUBLE_EQ(lunar.factor(0.0, other), 1.0);
}

TEST(ModulatorTest, PlanetarySumsCosines) {
    std::vector<PlanetaryBody> bodies{{"a", 0.02, 100.0, 0.0}, {"b", 0.01, 50.0, 0.0}};
    PlanetaryModulator planetary(bodies);
    ForcingSample sample;

    EXPECT_NEAR(planetary.factor(0.0, sample), 1.03, 1e-14);
    // Half period of body a: cos = -1; full period of body b: cos = 1
    EXPECT_NEAR(planetary.factor(50.0, sample), 1.0 - 0.02 + 0.01, 1e-12);
    EXPECT_EQ(planetary.bodies().size(), 2u);
}

TEST(ModulatorTest, ScaleMultipliesAmplitude) {
    std::vector<PlanetaryBody> bodies{{"a", 0.02, 100.0, 0.0}};
    PlanetaryModulator doubled(bodies, 2.0);
    ForcingSample sample;
    EXPECT_NEAR(doubled.factor(0.0, sample), 1.04, 1e-14);
}

TEST(ModulatorTest, SolarAngularMomentum) {
    std::vector<CycleComponent> comps{{0.03, 400.0, 0.0}};
    SolarAngularMomentumModulator sam(comps);
    ForcingSample sample;
    EXPECT_DOUBLE_EQ(sam.factor(0.0, sample), 1.0);
    EXPECT_NEAR(sam.factor(100.0, sample), 1.03, 1e-12);
}

TEST(ModulatorTest, DebrisSaturates) {
    DebrisModulator debris(0.05, 10.0);
    ForcingSample sample;

    sample.debris_energy = 0.0;
    EXPECT_DOUBLE_EQ(debris.factor(0.0, sample), 1.0);

    sample.debris_energy = 10.0;
    EXPECT_DOUBLE_EQ(debris.factor(0.0, sample), 1.025);

    sample.debris_energy = 1e9;
    EXPECT_LT(debris.factor(0.0, sample), 1.05);
    EXPECT_NEAR(debris.factor(0.0, sample), 1.05, 1e-8);
}

TEST(ModulatorTest, InvalidPeriodsRejected) {
    EXPECT_THROW(LunarModulator(CycleComponent{0.1, 0.0, 0.0}, CycleComponent{0.05, 206.0, 0.0}),
                 ConfigurationError);
    EXPECT_THROW(PlanetaryModulator({{"x", 0.1, -5.0, 0.0}}), ConfigurationError);
    EXPECT_THROW(DebrisModulator(0.05, 0.0), ConfigurationError);
}

TEST(ModulatorSetTest, EmptySetIsIdentity) {
    ModulatorSet set;
    ForcingSample sample;
    EXPECT_TRUE(set.empty());
    EXPECT_DOUBLE_EQ(set.composite(123.4, sample), 1.0);
}

TEST(ModulatorSetTest, CompositeIsProduct) {
    ModulatorSet set;
    set.add(std::make_unique<LunarModulator>());
    set.add(std::make_unique<DebrisModulator>(0.05, 10.0));

    ForcingSample sample;
    sample.debris_energy = 10.0;
    const double t = 6.825;

    LunarModulator lunar;
    DebrisModulator debris(0.05, 10.0);
    EXPECT_NEAR(set.composite(t, sample),
                lunar.factor(t, sample) * debris.factor(t, sample), 1e-14);
}

TEST(ModulatorSetTest, AddReplacesSameType) {
    ModulatorSet set;
    set.add(std::make_unique<DebrisModulator>(0.05, 10.0));
    set.add(std::make_unique<DebrisModulator>(0.5, 10.0));
    EXPECT_EQ(set.size(), 1u);

    ForcingSample sample;
    sample.debris_energy = 10.0;
    EXPECT_DOUBLE_EQ(set.composite(0.0, sample), 1.25);
}

TEST(ModulatorSetTest, FromConfigHonoursEnabledSet) {
    RunConfig config;
    config.modulators_enabled = {ModulatorType::LUNAR, ModulatorType::SOLAR_AM};
    ModulatorSet set = ModulatorSet::fromConfig(config);

    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.isEnabled(ModulatorType::LUNAR));
    EXPECT_TRUE(set.isEnabled(ModulatorType::SOLAR_AM));
    EXPECT_FALSE(set.isEnabled(ModulatorType::PLANETARY));
    ASSERT_NE(set.find(ModulatorType::LUNAR), nullptr);
    EXPECT_EQ(set.find(ModulatorType::LUNAR)->name(), "lunar");
    EXPECT_EQ(set.find(ModulatorType::DEBRIS), nullptr);
}
