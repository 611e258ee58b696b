/**
 * @file test_monte_carlo.cpp
 * @brief Ensemble runs across ranks and worker threads
 *
 * These tests hold on any number of MPI ranks: every rank ends with the
 * same gathered result.
 */

#include <gtest/gtest.h>
#include "MonteCarloDriver.hpp"
#include <set>

using namespace CEED;

class MonteCarloTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        MPI_Comm_size(PETSC_COMM_WORLD, &size);
        config.n_steps = 60;
        ensemble.size = 8;
        ensemble.rng_seed = 4242;
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    int rank;
    int size;
    RunConfig config;
    EnsembleConfig ensemble;
};

TEST_F(MonteCarloTest, DeriveSeedIsDeterministicAndDistinct) {
    std::set<std::uint64_t> seeds;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(MonteCarloDriver::deriveSeed(7, i), MonteCarloDriver::deriveSeed(7, i));
        seeds.insert(MonteCarloDriver::deriveSeed(7, i));
    }
    EXPECT_EQ(seeds.size(), 1000u);
    EXPECT_NE(MonteCarloDriver::deriveSeed(7, 0), MonteCarloDriver::deriveSeed(8, 0));
}

TEST_F(MonteCarloTest, SampledParametersStayInBounds) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);
    MonteCarloDriver driver(PETSC_COMM_WORLD, config, ensemble, forcing);

    for (int i = 0; i < 200; ++i) {
        SampledParameters p = driver.sampleParameters(i);
        EXPECT_GE(p.alpha_max, ensemble.alpha_max.low);
        EXPECT_LE(p.alpha_max, ensemble.alpha_max.high);
        EXPECT_LE(p.alpha_base, p.alpha_max);
        EXPECT_GE(p.alpha_base, ensemble.alpha_base.low);
        EXPECT_GE(p.kappa, ensemble.kappa.low);
        EXPECT_LE(p.kappa, ensemble.kappa.high);
        EXPECT_GE(p.e_crit, ensemble.e_crit.low);
        EXPECT_LE(p.e_crit, ensemble.e_crit.high);
        EXPECT_GE(p.modulator_scale, ensemble.modulator_scale.low);
        EXPECT_LE(p.modulator_scale, ensemble.modulator_scale.high);
    }
}

TEST_F(MonteCarloTest, FixedDistributionReturnsMean) {
    std::mt19937_64 rng(1);
    ParameterDistribution fixed(DistributionType::FIXED, 2.5, 0.0, 10.0);
    EXPECT_DOUBLE_EQ(MonteCarloDriver::sample(fixed, rng), 2.5);

    ParameterDistribution degenerate(DistributionType::NORMAL, 3.0, 3.0, 3.0);
    EXPECT_DOUBLE_EQ(MonteCarloDriver::sample(degenerate, rng), 3.0);
}

TEST_F(MonteCarloTest, EnsembleMatchesStandaloneMembers) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);
    MonteCarloDriver driver(PETSC_COMM_WORLD, config, ensemble, forcing);

    EnsembleResult result;
    PetscErrorCode ierr = driver.runEnsemble(ensemble.size, result);
    ASSERT_EQ(ierr, 0);
    ASSERT_EQ(result.n_members, ensemble.size);
    ASSERT_EQ(static_cast<int>(result.members.size()), ensemble.size);

    // Running a member alone reproduces its ensemble outcome exactly
    for (int i = 0; i < ensemble.size; ++i) {
        const MemberSummary& m = result.members[i];
        EXPECT_EQ(m.index, i);
        EXPECT_EQ(m.seed, driver.memberSeed(i));
        MemberSummary alone = driver.runMember(i);
        EXPECT_EQ(alone.total_energy, m.total_energy) << "member " << i;
        EXPECT_EQ(alone.final_phase, m.final_phase);
    }
}

TEST_F(MonteCarloTest, ConcurrencyDoesNotChangeResults) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);

    ensemble.max_concurrency = 1;
    MonteCarloDriver serial(PETSC_COMM_WORLD, config, ensemble, forcing);
    EnsembleResult a;
    ASSERT_EQ(serial.runEnsemble(ensemble.size, a), 0);

    ensemble.max_concurrency = 4;
    MonteCarloDriver threaded(PETSC_COMM_WORLD, config, ensemble, forcing);
    EnsembleResult b;
    ASSERT_EQ(threaded.runEnsemble(ensemble.size, b), 0);

    ASSERT_EQ(a.members.size(), b.members.size());
    for (size_t i = 0; i < a.members.size(); ++i) {
        EXPECT_EQ(a.members[i].total_energy, b.members[i].total_energy);
        EXPECT_EQ(a.members[i].params.kappa, b.members[i].params.kappa);
    }
    ASSERT_EQ(a.total_energy_bands.size(), b.total_energy_bands.size());
    for (size_t s = 0; s < a.total_energy_bands.size(); ++s) {
        EXPECT_EQ(a.total_energy_bands[s].p50, b.total_energy_bands[s].p50);
    }
}

TEST_F(MonteCarloTest, SeedOverrideIsIndependentOfBaseSeed) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);

    ensemble.seed_overrides[2] = 777;
    MonteCarloDriver d1(PETSC_COMM_WORLD, config, ensemble, forcing);
    ensemble.rng_seed = 1;
    MonteCarloDriver d2(PETSC_COMM_WORLD, config, ensemble, forcing);

    EXPECT_EQ(d1.memberSeed(2), 777u);
    EXPECT_EQ(d2.memberSeed(2), 777u);
    EXPECT_NE(d1.memberSeed(3), d2.memberSeed(3));
    EXPECT_EQ(d1.runMember(2).total_energy, d2.runMember(2).total_energy);
}

TEST_F(MonteCarloTest, AggregatesAreConsistent) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);
    ensemble.size = 16;
    ensemble.max_concurrency = 2;
    MonteCarloDriver driver(PETSC_COMM_WORLD, config, ensemble, forcing);

    EnsembleResult result;
    ASSERT_EQ(driver.runEnsemble(ensemble.size, result), 0);
    EXPECT_EQ(result.n_valid, 16);
    EXPECT_EQ(result.n_invalid + result.n_cancelled, 0);

    ASSERT_EQ(result.total_energy_bands.size(), static_cast<size_t>(config.n_steps + 1));
    for (const auto& b : result.total_energy_bands) {
        EXPECT_LE(b.p5, b.p25);
        EXPECT_LE(b.p25, b.p50);
        EXPECT_LE(b.p50, b.p75);
        EXPECT_LE(b.p75, b.p95);
    }

    int phase_total = 0;
    for (int c : result.final_phase_counts) phase_total += c;
    EXPECT_EQ(phase_total, result.n_valid);

    int hist_total = 0;
    for (int c : result.runaway_histogram) hist_total += c;
    EXPECT_EQ(hist_total, result.n_valid);
    EXPECT_EQ(result.final_runaway.count, result.n_valid);

    // Default seeds sum to 125.125, already in STRESS at step 0
    const PhaseCrossingStatistics& stress = result.phase_crossing[index(Phase::STRESS)];
    EXPECT_EQ(stress.count, result.n_valid);
    EXPECT_DOUBLE_EQ(stress.fraction_reached, 1.0);
    EXPECT_DOUBLE_EQ(stress.p50_days, 0.0);

    for (size_t k = 1; k < NUM_THRESHOLDS; ++k) {
        EXPECT_LE(result.threshold_exceedance[k], result.threshold_exceedance[k - 1]);
    }
}

TEST_F(MonteCarloTest, KeptTrajectoriesMatchSummaries) {
    SyntheticForcingSource forcing(config.synthetic, config.dt_days);
    ensemble.keep_trajectories = true;
    MonteCarloDriver driver(PETSC_COMM_WORLD, config, ensemble, forcing);

    EnsembleResult result;
    ASSERT_EQ(driver.runEnsemble(ensemble.size, result), 0);

    // Round-robin assignment: this rank holds members rank, rank + size, ...
    int expected = 0;
    for (int i = rank; i < ensemble.size; i += size) ++expected;
    EXPECT_EQ(static_cast<int>(result.trajectories.size()), expected);

    for (const auto& kv : result.trajectories) {
        EXPECT_EQ(kv.first % size, rank);
        EXPECT_EQ(kv.second.size(), static_cast<size_t>(config.n_steps + 1));
        EXPECT_EQ(kv.second.totalEnergySeries(), result.members[kv.first].total_energy);
    }
}
