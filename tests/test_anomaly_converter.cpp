#include <Orrery/AnomalyConverter.hpp>
#include <Orrery/Constants.hpp>

#include <gtest/gtest.h>

#include <cmath>

namespace AC = Orrery::AnomalyConverter;
using Orrery::kPi;

TEST(AnomalyConverter, TrueAnomalyAtApsides)
{
    EXPECT_NEAR(AC::trueAnomaly(0.0, 0.5), 0.0, 1e-12);
    EXPECT_NEAR(std::fabs(AC::trueAnomaly(kPi, 0.5)), kPi, 1e-12);
}

TEST(AnomalyConverter, TrueAnomalyEqualsEccentricForCircle)
{
    for (double E : {0.1, 1.0, 2.5, -1.2})
        EXPECT_NEAR(AC::trueAnomaly(E, 0.0), E, 1e-12);
}

TEST(AnomalyConverter, TrueAnomalyLeadsEccentricOnOutboundLeg)
{
    // Between periapsis and apoapsis the body is ahead of the auxiliary circle
    EXPECT_GT(AC::trueAnomaly(1.0, 0.6), 1.0);
}

TEST(AnomalyConverter, RadiusMatchesOrbitEquation)
{
    const double a = 2.0, e = 0.3;
    for (double E : {0.0, 0.7, 1.9, kPi}) {
        const double nu = AC::trueAnomaly(E, e);
        EXPECT_NEAR(AC::radius(a, e, E), AC::radiusAtTrueAnomaly(a, e, nu), 1e-12);
    }
    EXPECT_NEAR(AC::radius(a, e, 0.0), a * (1.0 - e), 1e-12);
    EXPECT_NEAR(AC::radius(a, e, kPi), a * (1.0 + e), 1e-12);
}

TEST(AnomalyConverter, MeanLongitudeToMeanAnomaly)
{
    EXPECT_NEAR(AC::meanLongitudeToMeanAnomaly(1.0, 0.25), 0.75, 1e-12);
    // Wraps negative differences into [0, 2*pi)
    EXPECT_NEAR(AC::meanLongitudeToMeanAnomaly(0.25, 1.0), Orrery::kTwoPi - 0.75, 1e-12);
}
