/**
 * @file test_forcing_source.cpp
 * @brief Unit tests for synthetic, constant and replayed forcing
 */

#include <gtest/gtest.h>
#include "ForcingSource.hpp"
#include <cmath>
#include <stdexcept>

using namespace CEED;

TEST(ForcingSourceTest, SyntheticBaseline) {
    SyntheticForcingParams params;
    SyntheticForcingSource source(params, 1.0);

    ForcingSample s0 = source.evaluate(0.0);
    EXPECT_NEAR(s0.solar_flux, 1.8 * 1.3, 1e-12);
    EXPECT_DOUBLE_EQ(s0.geomagnetic_index, 3.0);
    EXPECT_DOUBLE_EQ(s0.thermospheric_density, 1.0);

    // Solar minimum half a cycle later
    ForcingSample half = source.evaluate(5.5 * 365.25);
    EXPECT_NEAR(half.solar_flux, 1.8 * 0.7, 1e-9);
    EXPECT_NEAR(half.thermospheric_density, 1.0 + 0.05 * 5.5, 1e-12);
}

TEST(ForcingSourceTest, GeomagneticIndexCapped) {
    SyntheticForcingParams params;
    params.geomagnetic_trend = 10.0;
    SyntheticForcingSource source(params, 1.0);
    EXPECT_DOUBLE_EQ(source.evaluate(10.0 * 365.25).geomagnetic_index, 9.0);
}

TEST(ForcingSourceTest, NextSampleAdvancesTime) {
    SyntheticForcingSource source(SyntheticForcingParams(), 0.5);
    EXPECT_DOUBLE_EQ(source.nextSample().time_days, 0.5);
    EXPECT_DOUBLE_EQ(source.nextSample().time_days, 1.0);
    EXPECT_EQ(source.stepsTaken(), 2);
    source.reset();
    EXPECT_DOUBLE_EQ(source.nextSample().time_days, 0.5);
}

TEST(ForcingSourceTest, CloneStartsAtBeginning) {
    SyntheticForcingSource source(SyntheticForcingParams(), 1.0);
    source.nextSample();
    source.nextSample();
    source.nextSample();

    std::unique_ptr<ForcingSource> copy = source.clone();
    EXPECT_DOUBLE_EQ(copy->nextSample().time_days, 1.0);
    EXPECT_DOUBLE_EQ(source.nextSample().time_days, 4.0);
}

TEST(ForcingSourceTest, ChannelMapping) {
    ForcingSample s;
    s.solar_flux = 1.0;
    s.geomagnetic_index = 2.0;
    s.thermospheric_density = 3.0;
    s.ocean_circulation = 4.0;
    s.debris_energy = 5.0;
    EXPECT_DOUBLE_EQ(s.channel(Subsystem::SOLAR), 1.0);
    EXPECT_DOUBLE_EQ(s.channel(Subsystem::MAGNETIC), 2.0);
    EXPECT_DOUBLE_EQ(s.channel(Subsystem::ATMOSPHERIC), 3.0);
    EXPECT_DOUBLE_EQ(s.channel(Subsystem::OCEANIC), 4.0);
    EXPECT_DOUBLE_EQ(s.channel(Subsystem::DEBRIS), 5.0);
}

TEST(ForcingSourceTest, ConstantZero) {
    ConstantForcingSource source = ConstantForcingSource::zero(2.0);
    ForcingSample s = source.nextSample();
    EXPECT_DOUBLE_EQ(s.time_days, 2.0);
    EXPECT_DOUBLE_EQ(s.solar_flux, 0.0);
    EXPECT_TRUE(s.modulation_terms.empty());
}

TEST(ForcingSourceTest, ReplayExhaustionThrows) {
    std::vector<ForcingSample> series(2);
    series[0].solar_flux = 1.0;
    series[1].solar_flux = 2.0;
    ReplayForcingSource source(series);

    EXPECT_EQ(source.size(), 2u);
    EXPECT_DOUBLE_EQ(source.nextSample().solar_flux, 1.0);
    EXPECT_DOUBLE_EQ(source.nextSample().solar_flux, 2.0);
    EXPECT_EQ(source.remaining(), 0u);
    EXPECT_THROW(source.nextSample(), std::out_of_range);

    std::unique_ptr<ForcingSource> copy = source.clone();
    EXPECT_DOUBLE_EQ(copy->nextSample().solar_flux, 1.0);
}

TEST(ForcingSourceTest, FactorySelectsMode) {
    RunConfig config;
    std::unique_ptr<ForcingSource> synthetic = createForcingSource(config);
    EXPECT_NE(dynamic_cast<SyntheticForcingSource*>(synthetic.get()), nullptr);

    config.forcing_mode = ForcingMode::REPLAY;
    config.replay_file = "";
    EXPECT_THROW(createForcingSource(config), ConfigurationError);

    config.replay_file = "no_such_forcing_file.csv";
    EXPECT_THROW(createForcingSource(config), std::runtime_error);
}

TEST(ForcingSourceTest, QuiescentSample) {
    ConstantForcingSource zero = ConstantForcingSource::zero();
    EXPECT_TRUE(zero.nextSample().isQuiescent());

    ForcingSample s;
    s.ocean_circulation = 0.1;
    EXPECT_FALSE(s.isQuiescent());

    ForcingSample observed;
    observed.modulation_terms["lunar"] = 1.0;
    EXPECT_FALSE(observed.isQuiescent());
}
