#include <Orrery/EpochClock.hpp>

#include <gtest/gtest.h>

#include <chrono>

using namespace Orrery;

TEST(EpochClock, TimeSinceEpoch)
{
    OrbitalElements el;
    el.referenceEpoch = 100.0;
    EXPECT_DOUBLE_EQ(EpochClock::timeSinceEpoch(el, 130.0), 30.0);
    EXPECT_DOUBLE_EQ(EpochClock::timeSinceEpoch(el, 70.0), -30.0);
}

TEST(EpochClock, RateUnitsUseInterval)
{
    OrbitalElements el;
    EXPECT_DOUBLE_EQ(EpochClock::rateUnitsElapsed(el, 500.0), 0.0);

    el.rates = SecularRates{};
    el.rates->interval = kDaysPerJulianCentury;
    EXPECT_DOUBLE_EQ(EpochClock::rateUnitsElapsed(el, kDaysPerJulianCentury * 2.0), 2.0);
}

TEST(EpochClock, NoRatesIsIdentity)
{
    OrbitalElements el;
    el.semiMajorAxis = 3.0;
    el.eccentricity = 0.1;
    el.inclination = 0.2;
    const OrbitalElements out = EpochClock::applySecularRates(el, 10.0);
    EXPECT_EQ(out.semiMajorAxis, el.semiMajorAxis);
    EXPECT_EQ(out.eccentricity, el.eccentricity);
    EXPECT_EQ(out.inclination, el.inclination);
    EXPECT_FALSE(out.rates.has_value());
}

TEST(EpochClock, RatesAreLinear)
{
    OrbitalElements el;
    el.semiMajorAxis = 1.0;
    el.eccentricity = 0.1;
    el.longAscNode = 1.0;
    SecularRates r;
    r.semiMajorAxis = 0.01;
    r.eccentricity = 0.001;
    r.longAscNode = 0.1;
    el.rates = r;

    const OrbitalElements one = EpochClock::applySecularRates(el, 1.0);
    const OrbitalElements three = EpochClock::applySecularRates(el, 3.0);
    EXPECT_NEAR(one.semiMajorAxis, 1.01, 1e-12);
    EXPECT_NEAR(three.semiMajorAxis, 1.03, 1e-12);
    EXPECT_NEAR(three.eccentricity, 0.103, 1e-12);
    EXPECT_NEAR(three.longAscNode, 1.3, 1e-12);
    EXPECT_NEAR(EpochClock::applySecularRates(el, -1.0).semiMajorAxis, 0.99, 1e-12);
}

TEST(EpochClock, AngleRatesWrap)
{
    OrbitalElements el;
    el.argPeriapsis = kTwoPi - 0.1;
    SecularRates r;
    r.argPeriapsis = 0.3;
    el.rates = r;
    EXPECT_NEAR(EpochClock::applySecularRates(el, 1.0).argPeriapsis, 0.2, 1e-12);
}

TEST(EpochClock, JulianDates)
{
    EXPECT_DOUBLE_EQ(EpochClock::julianDateFromUnixMillis(0), kUnixEpochJulianDate);
    // 2000-01-01T12:00:00Z
    EXPECT_DOUBLE_EQ(EpochClock::julianDateFromUnixMillis(946728000000LL), kJ2000);

    const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(946728000000LL));
    EXPECT_DOUBLE_EQ(EpochClock::julianDateFromTimePoint(tp), kJ2000);

    EXPECT_DOUBLE_EQ(EpochClock::daysSinceJ2000(kJ2000 + 10.0), 10.0);
    EXPECT_DOUBLE_EQ(EpochClock::centuriesSinceJ2000(kJ2000 + kDaysPerJulianCentury), 1.0);
}
