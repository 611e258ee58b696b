/**
 * @file test_coupling_topology.cpp
 * @brief Unit tests for zone coupling, weights and forcing routing
 */

#include <gtest/gtest.h>
#include "CouplingTopology.hpp"
#include <numeric>

using namespace CEED;

class CouplingTopologyTest : public ::testing::Test {
protected:
    RunConfig config;
};

TEST_F(CouplingTopologyTest, DefaultConfigIsValidAndSymmetric) {
    CouplingTopology topo = CouplingTopology::fromConfig(config);
    EXPECT_TRUE(topo.isSymmetric());
    EXPECT_DOUBLE_EQ(topo.coupling(Zone::POLAR, Zone::MID_LATITUDE), 0.3);
    EXPECT_DOUBLE_EQ(topo.diffusionRate(), 0.1);
}

TEST_F(CouplingTopologyTest, WeightsAreNormalised) {
    config.subsystem_weights[index(Subsystem::SOLAR)] = {2.0, 2.0, 4.0, 0.0};
    CouplingTopology topo = CouplingTopology::fromConfig(config);

    for (size_t s = 0; s < NUM_SUBSYSTEMS; ++s) {
        double sum = 0.0;
        for (size_t z = 0; z < NUM_ZONES; ++z) {
            sum += topo.weight(static_cast<Subsystem>(s), static_cast<Zone>(z));
        }
        EXPECT_NEAR(sum, 1.0, 1e-14);
    }
    EXPECT_DOUBLE_EQ(topo.weight(Subsystem::SOLAR, Zone::EQUATORIAL), 0.5);
    EXPECT_FALSE(topo.feedsZone(Subsystem::SOLAR, Zone::OCEANIC));
    EXPECT_TRUE(topo.feedsZone(Subsystem::OCEANIC, Zone::OCEANIC));
}

TEST_F(CouplingTopologyTest, RejectsNegativeCoefficient) {
    config.zone_coupling[1][2] = -0.1;
    EXPECT_THROW(CouplingTopology::fromConfig(config), ConfigurationError);
}

TEST_F(CouplingTopologyTest, RejectsWrongDimensions) {
    config.zone_coupling.pop_back();
    EXPECT_THROW(CouplingTopology::fromConfig(config), ConfigurationError);

    RunConfig other;
    other.subsystem_weights[0] = {1.0, 0.0};
    EXPECT_THROW(CouplingTopology::fromConfig(other), ConfigurationError);
}

TEST_F(CouplingTopologyTest, RejectsZeroWeightRow) {
    config.subsystem_weights[index(Subsystem::ATMOSPHERIC)] = {0.0, 0.0, 0.0, 0.0};
    EXPECT_THROW(CouplingTopology::fromConfig(config), ConfigurationError);
}

TEST_F(CouplingTopologyTest, RejectsUnstableDiffusion) {
    // Largest off-diagonal row sum is 0.8
    config.diffusion_rate = 2.0;
    EXPECT_THROW(CouplingTopology::fromConfig(config), ConfigurationError);

    config.diffusion_rate = 1.2;
    EXPECT_NO_THROW(CouplingTopology::fromConfig(config));
}

TEST_F(CouplingTopologyTest, AsymmetricMatrixAccepted) {
    config.zone_coupling[0][1] = 0.5;
    CouplingTopology topo = CouplingTopology::fromConfig(config);
    EXPECT_FALSE(topo.isSymmetric());
}

TEST_F(CouplingTopologyTest, SymmetricDiffusionConservesTotal) {
    CouplingTopology topo = CouplingTopology::fromConfig(config);
    ZoneArray zones{{80.0, 10.0, 5.0, 30.0}};
    ZoneArray out = topo.diffuse(zones);

    double before = std::accumulate(zones.begin(), zones.end(), 0.0);
    double after = std::accumulate(out.begin(), out.end(), 0.0);
    EXPECT_NEAR(after, before, 1e-12);
    // Energy flows out of the fullest zone
    EXPECT_LT(out[0], zones[0]);
    EXPECT_GT(out[1], zones[1]);
}

TEST_F(CouplingTopologyTest, ProjectionMatchesActiveTotal) {
    CouplingTopology topo = CouplingTopology::fromConfig(config);
    SubsystemArray energy{{45.0, 23.125, 29.5, 27.5, 12.0}};
    std::array<bool, NUM_SUBSYSTEMS> active{{true, true, true, true, false}};

    ZoneArray zones = topo.project(energy, active);
    double sum = std::accumulate(zones.begin(), zones.end(), 0.0);
    EXPECT_NEAR(sum, 125.125, 1e-12);
}

TEST_F(CouplingTopologyTest, RoutesForcingThroughGain) {
    CouplingTopology topo = CouplingTopology::fromConfig(config);
    ForcingSample sample;
    sample.solar_flux = 2.0;
    sample.geomagnetic_index = 4.0;

    EXPECT_DOUBLE_EQ(topo.routeForcing(Subsystem::SOLAR, sample), 0.04);
    EXPECT_DOUBLE_EQ(topo.routeForcing(Subsystem::MAGNETIC, sample), -0.02);
}
