/**
 * @file test_trajectory.cpp
 * @brief Unit tests for EnergyState and Trajectory bookkeeping
 */

#include <gtest/gtest.h>
#include "EnergyState.hpp"
#include <cmath>
#include <stdexcept>

using namespace CEED;

namespace {

TrajectoryPoint makePoint(int step, double total, Phase phase) {
    TrajectoryPoint p;
    p.state.step = step;
    p.state.time_days = step;
    p.state.active = {{true, false, false, false, false}};
    p.state.subsystem_energy[0] = total;
    p.phase = phase;
    return p;
}

} // namespace

TEST(EnergyStateTest, TotalsCountActiveSubsystemsOnly) {
    EnergyState s;
    s.active = {{true, true, true, true, false}};
    s.subsystem_energy = {{1.0, 2.0, 3.0, 4.0, 100.0}};
    s.zone_energy = {{2.5, 2.5, 2.5, 2.5}};

    EXPECT_DOUBLE_EQ(s.totalEnergy(), 10.0);
    EXPECT_DOUBLE_EQ(s.zoneTotal(), 10.0);
    EXPECT_EQ(s.activeCount(), 4);
    EXPECT_TRUE(s.allFinite());

    s.zone_energy[2] = INFINITY;
    EXPECT_FALSE(s.allFinite());
}

TEST(DivergenceRecordTest, DescribeNamesLocation) {
    DivergenceRecord r;
    r.step = 12;
    r.subsystem = static_cast<int>(Subsystem::OCEANIC);
    r.value = NAN;
    std::string text = r.describe();
    EXPECT_NE(text.find("step 12"), std::string::npos);
    EXPECT_NE(text.find("OCEANIC"), std::string::npos);

    DivergenceRecord z;
    z.zone = static_cast<int>(Zone::POLAR);
    EXPECT_NE(z.describe().find("zone POLAR"), std::string::npos);
}

TEST(TrajectoryTest, AppendAndQuery) {
    Trajectory t;
    EXPECT_TRUE(t.empty());
    EXPECT_THROW(t.back(), std::out_of_range);

    t.append(makePoint(0, 100.0, Phase::STABLE));
    t.append(makePoint(1, 130.0, Phase::STRESS));
    t.append(makePoint(2, 210.0, Phase::AMPLIFICATION));

    EXPECT_EQ(t.size(), 3u);
    EXPECT_EQ(t.back().state.step, 2);
    EXPECT_EQ(t.status(), RunStatus::VALID);

    std::vector<double> totals = t.totalEnergySeries();
    ASSERT_EQ(totals.size(), 3u);
    EXPECT_DOUBLE_EQ(totals[1], 130.0);
    EXPECT_EQ(t.phaseSeries()[2], Phase::AMPLIFICATION);
}

TEST(TrajectoryTest, FirstCrossingSteps) {
    Trajectory t;
    t.append(makePoint(0, 100.0, Phase::STABLE));
    t.append(makePoint(1, 130.0, Phase::STRESS));
    // A jump past COUPLING counts as crossing it too
    t.append(makePoint(2, 210.0, Phase::AMPLIFICATION));
    t.append(makePoint(3, 140.0, Phase::STRESS));

    std::array<int, NUM_PHASES> first = t.firstCrossingSteps();
    EXPECT_EQ(first[index(Phase::STABLE)], 0);
    EXPECT_EQ(first[index(Phase::STRESS)], 1);
    EXPECT_EQ(first[index(Phase::COUPLING)], 2);
    EXPECT_EQ(first[index(Phase::AMPLIFICATION)], 2);
    EXPECT_EQ(first[index(Phase::CASCADE)], -1);
}

TEST(TrajectoryTest, FinalizedTrajectoryRejectsAppend) {
    Trajectory t;
    t.append(makePoint(0, 100.0, Phase::STABLE));
    t.finalize();
    EXPECT_TRUE(t.isFinalized());
    EXPECT_THROW(t.append(makePoint(1, 100.0, Phase::STABLE)), std::logic_error);
}

TEST(TrajectoryTest, StatusTransitions) {
    Trajectory invalid;
    DivergenceRecord r;
    r.step = 5;
    invalid.markInvalid(r);
    EXPECT_EQ(invalid.status(), RunStatus::INVALID);
    EXPECT_FALSE(invalid.isValid());
    EXPECT_EQ(invalid.divergence().step, 5);

    Trajectory cancelled;
    cancelled.markCancelled(7);
    EXPECT_EQ(cancelled.status(), RunStatus::CANCELLED);
    EXPECT_EQ(cancelled.cancelledAtStep(), 7);
}
