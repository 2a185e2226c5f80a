#include <Orrery/SimulationClock.hpp>

#include <gtest/gtest.h>

using Orrery::SimulationClock;

TEST(SimulationClock, StartsAtEpochWithDefaultSpeed)
{
    SimulationClock clock;
    EXPECT_DOUBLE_EQ(clock.julianDate(), Orrery::kJ2000);
    EXPECT_DOUBLE_EQ(clock.timeSpeed(), SimulationClock::kDefaultTimeSpeed);
    EXPECT_FALSE(clock.isPaused());
}

TEST(SimulationClock, AdvanceScalesRealTime)
{
    SimulationClock clock;
    clock.setTimeSpeed(86400.0);
    EXPECT_DOUBLE_EQ(clock.advance(0.5), 0.5);
    EXPECT_DOUBLE_EQ(clock.simulationDays(), 0.5);
    EXPECT_DOUBLE_EQ(clock.julianDate(), Orrery::kJ2000 + 0.5);
    EXPECT_DOUBLE_EQ(clock.lastDeltaDays(), 0.5);
}

TEST(SimulationClock, PauseStopsTime)
{
    SimulationClock clock;
    clock.pause();
    EXPECT_DOUBLE_EQ(clock.advance(10.0), 0.0);
    EXPECT_DOUBLE_EQ(clock.simulationDays(), 0.0);
    clock.togglePause();
    EXPECT_GT(clock.advance(1.0), 0.0);
    clock.togglePause();
    EXPECT_TRUE(clock.isPaused());
    clock.play();
    EXPECT_FALSE(clock.isPaused());
}

TEST(SimulationClock, SpeedIsClamped)
{
    SimulationClock clock;
    clock.setTimeSpeed(0.01);
    EXPECT_DOUBLE_EQ(clock.timeSpeed(), SimulationClock::kMinTimeSpeed);
    clock.setTimeSpeed(1e9);
    EXPECT_DOUBLE_EQ(clock.timeSpeed(), SimulationClock::kMaxTimeSpeed);
}

TEST(SimulationClock, ResetAndJumps)
{
    SimulationClock clock;
    clock.setTimeSpeed(500.0);
    clock.advance(100.0);
    clock.reset();
    EXPECT_DOUBLE_EQ(clock.simulationDays(), 0.0);
    EXPECT_DOUBLE_EQ(clock.timeSpeed(), 500.0);

    clock.setJulianDate(Orrery::kJ2000 + 42.0);
    EXPECT_DOUBLE_EQ(clock.simulationDays(), 42.0);
    clock.setSimulationDays(3.0);
    EXPECT_DOUBLE_EQ(clock.julianDate(), Orrery::kJ2000 + 3.0);
}

TEST(SimulationClock, FormatsElapsedTime)
{
    SimulationClock clock;
    clock.setSimulationDays(12.5 / 1440.0);
    EXPECT_EQ(clock.formatSimulationTime(), "12.5 minutes");
    clock.setSimulationDays(3.0 / 24.0);
    EXPECT_EQ(clock.formatSimulationTime(), "3.0 hours");
    clock.setSimulationDays(123.4);
    EXPECT_EQ(clock.formatSimulationTime(), "123.4 days");
    clock.setSimulationDays(2.5 * 365.25);
    EXPECT_EQ(clock.formatSimulationTime(), "2.50 years");
}

TEST(SimulationClock, FormatsSpeed)
{
    SimulationClock clock;
    EXPECT_EQ(clock.formatTimeSpeed(), "100.0kx");
    clock.setTimeSpeed(500.0);
    EXPECT_EQ(clock.formatTimeSpeed(), "500x");
}
