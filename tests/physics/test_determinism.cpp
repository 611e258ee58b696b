/**
 * @file test_determinism.cpp
 * @brief Reproducibility of runs from their seed
 */

#include <gtest/gtest.h>
#include "ConvergenceEngine.hpp"

using namespace CEED;

class DeterminismTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.n_steps = 200;
        config.noise_sigma = 1.0;
        config.modulators_enabled = {ModulatorType::LUNAR, ModulatorType::SOLAR_AM};
    }

    Trajectory runWithSeed(const ConvergenceEngine& engine, std::uint64_t seed) {
        SyntheticForcingSource forcing(config.synthetic, config.dt_days);
        return engine.run(config.n_steps, forcing, seed);
    }

    static bool identical(const Trajectory& a, const Trajectory& b) {
        if (a.size() != b.size()) return false;
        for (size_t k = 0; k < a.size(); ++k) {
            const auto& pa = a.at(k);
            const auto& pb = b.at(k);
            if (pa.state.subsystem_energy != pb.state.subsystem_energy) return false;
            if (pa.state.zone_energy != pb.state.zone_energy) return false;
            if (pa.phase != pb.phase) return false;
            if (pa.runaway_probability != pb.runaway_probability) return false;
        }
        return true;
    }

    RunConfig config;
};

TEST_F(DeterminismTest, SameSeedSameTrajectory) {
    ConvergenceEngine engine(config);
    Trajectory a = runWithSeed(engine, 1234);
    Trajectory b = runWithSeed(engine, 1234);
    EXPECT_TRUE(identical(a, b));
}

TEST_F(DeterminismTest, SeparateEnginesAgree) {
    ConvergenceEngine e1(config);
    ConvergenceEngine e2(config);
    EXPECT_TRUE(identical(runWithSeed(e1, 55), runWithSeed(e2, 55)));
}

TEST_F(DeterminismTest, DifferentSeedsDiverge) {
    ConvergenceEngine engine(config);
    Trajectory a = runWithSeed(engine, 1);
    Trajectory b = runWithSeed(engine, 2);
    ASSERT_EQ(a.size(), b.size());
    EXPECT_FALSE(identical(a, b));
}

TEST_F(DeterminismTest, ResetContextReplaysRun) {
    ConvergenceEngine engine(config);
    RunContext ctx = engine.makeContext(9);

    SyntheticForcingSource f1(config.synthetic, config.dt_days);
    Trajectory a = engine.run(engine.seedState(), config.n_steps, f1, ctx);

    ctx.reset(9);
    f1.reset();
    Trajectory b = engine.run(engine.seedState(), config.n_steps, f1, ctx);
    EXPECT_TRUE(identical(a, b));
}

TEST_F(DeterminismTest, NoiseFreeRunsIgnoreSeed) {
    config.noise_sigma = 0.0;
    ConvergenceEngine engine(config);
    EXPECT_TRUE(identical(runWithSeed(engine, 1), runWithSeed(engine, 987654321)));
}
