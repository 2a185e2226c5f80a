#include <Orrery/OrbitalMechanics.hpp>
#include <Orrery/OrbitErrors.hpp>

#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace Orrery;

namespace {

OrbitalElements eccentricBody()
{
    OrbitalElements el;
    el.semiMajorAxis = 1.0;
    el.eccentricity = 0.2;
    el.period = 1.0;
    return el;
}

OrbitalElements tiltedBody()
{
    OrbitalElements el;
    el.semiMajorAxis = 2.5;
    el.eccentricity = 0.35;
    el.inclination = 0.4;
    el.longAscNode = 1.2;
    el.argPeriapsis = 2.1;
    el.meanAnomalyEpoch = 0.7;
    el.period = 12.0;
    el.referenceEpoch = 5.0;
    return el;
}

} // namespace

TEST(OrbitalPosition, PeriapsisAtEpoch)
{
    const Vec3 p = orbitalPosition(eccentricBody(), 0.0);
    EXPECT_NEAR(p.x, 0.8, 1e-9);
    EXPECT_NEAR(p.y, 0.0, 1e-9);
    EXPECT_NEAR(p.z, 0.0, 1e-9);
}

TEST(OrbitalPosition, ApoapsisAtHalfPeriod)
{
    const Vec3 p = orbitalPosition(eccentricBody(), 0.5);
    EXPECT_NEAR(p.x, -1.2, 1e-9);
    EXPECT_NEAR(p.y, 0.0, 1e-9);
    EXPECT_NEAR(p.z, 0.0, 1e-9);
}

TEST(OrbitalPosition, CircularOrbitKeepsRadius)
{
    OrbitalElements el;
    el.semiMajorAxis = 3.0;
    el.inclination = 0.9;
    el.longAscNode = 0.3;
    el.period = 7.0;
    for (int k = 0; k < 50; ++k)
        EXPECT_NEAR(glm::length(orbitalPosition(el, k * 0.37)), 3.0, 1e-9);
}

TEST(OrbitalPosition, PeriodicWithoutRates)
{
    const OrbitalElements el = tiltedBody();
    for (double t : {0.0, 3.3, 17.9, -40.0}) {
        const Vec3 a = orbitalPosition(el, t);
        const Vec3 b = orbitalPosition(el, t + el.period);
        EXPECT_NEAR(a.x, b.x, 1e-9);
        EXPECT_NEAR(a.y, b.y, 1e-9);
        EXPECT_NEAR(a.z, b.z, 1e-9);
    }
}

TEST(OrbitalPosition, NegativePeriodMovesTheOtherWay)
{
    OrbitalElements pro;
    pro.semiMajorAxis = 1.0;
    pro.period = 1.0;
    OrbitalElements retro = pro;
    retro.period = -1.0;

    const Vec3 p = orbitalPosition(pro, 0.25);
    const Vec3 r = orbitalPosition(retro, 0.25);
    EXPECT_NEAR(p.y, 1.0, 1e-9);
    EXPECT_NEAR(r.y, -1.0, 1e-9);
    EXPECT_NEAR(p.x, r.x, 1e-9);
}

TEST(OrbitalPosition, Deterministic)
{
    const OrbitalElements el = tiltedBody();
    EXPECT_EQ(orbitalPosition(el, 123.456), orbitalPosition(el, 123.456));
}

TEST(OrbitalPosition, SnapshotCarriesAnomalies)
{
    const OrbitSnapshot s = describeOrbit(eccentricBody(), 0.5);
    EXPECT_NEAR(s.distance, 1.2, 1e-9);
    EXPECT_NEAR(s.meanAnomaly, kPi, 1e-12);
    EXPECT_NEAR(std::fabs(s.trueAnomaly), kPi, 1e-9);
    EXPECT_NEAR(s.periapsis, 0.8, 1e-12);
    EXPECT_NEAR(s.apoapsis, 1.2, 1e-12);
}

TEST(OrbitalPosition, ApsidesHelpers)
{
    EXPECT_DOUBLE_EQ(periapsisDistance(2.0, 0.25), 1.5);
    EXPECT_DOUBLE_EQ(apoapsisDistance(2.0, 0.25), 2.5);
}

TEST(OrbitalPosition, DriftOutOfRangeThrowsAtQuery)
{
    OrbitalElements el = eccentricBody();
    SecularRates r;
    r.eccentricity = 0.1;
    el.rates = r;

    OrbitalPositionCalculator calc(el);
    EXPECT_NO_THROW(calc.position(1.0));
    EXPECT_THROW(calc.position(10.0), InvalidElements);
}

TEST(OrbitalPositionCalculator, RejectsParabolicOrbitAtConstruction)
{
    OrbitalElements el = eccentricBody();
    el.eccentricity = 1.0;
    try {
        OrbitalPositionCalculator calc(el);
        FAIL() << "expected InvalidElements";
    } catch (const InvalidElements& e) {
        EXPECT_EQ(e.field(), "eccentricity");
    }
}

TEST(OrbitalPositionCalculator, RejectsOtherInvariants)
{
    OrbitalElements el = eccentricBody();
    el.semiMajorAxis = 0.0;
    EXPECT_THROW(OrbitalPositionCalculator{el}, InvalidElements);

    el = eccentricBody();
    el.period = 0.0;
    EXPECT_THROW(OrbitalPositionCalculator{el}, InvalidElements);

    el = eccentricBody();
    el.inclination = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(OrbitalPositionCalculator{el}, InvalidElements);

    el = eccentricBody();
    el.rates = SecularRates{};
    el.rates->interval = 0.0;
    EXPECT_THROW(OrbitalPositionCalculator{el}, InvalidElements);
}

TEST(OrbitalPositionCalculator, NormalizesAnglesOnce)
{
    OrbitalElements el = tiltedBody();
    el.longAscNode += 4.0 * kTwoPi;
    el.argPeriapsis -= kTwoPi;
    OrbitalPositionCalculator calc(el, KeplerSolver(), "wrapped");
    EXPECT_GE(calc.elements().longAscNode, 0.0);
    EXPECT_LT(calc.elements().longAscNode, kTwoPi);
    EXPECT_GE(calc.elements().argPeriapsis, 0.0);

    for (double t : {0.0, 9.0, 131.25})
        EXPECT_EQ(calc.position(t), orbitalPosition(el, t));
}

TEST(OrbitalPosition, OutOfRangeAnglesMatchNormalizedCopy)
{
    OrbitalElements raw = tiltedBody();
    raw.argPeriapsis = 7.5;
    raw.inclination = -0.3;
    raw.longAscNode = -1.1;
    const OrbitalElements wrapped = normalizedElements(raw);

    for (double t : {0.0, 3.7, 48.0})
        EXPECT_EQ(orbitalPosition(raw, t), orbitalPosition(wrapped, t));
}

TEST(OrbitalPosition, ZeroRatesMatchNoRates)
{
    OrbitalElements plain = tiltedBody();
    plain.argPeriapsis = 7.5;
    plain.longAscNode = -1.1;
    OrbitalElements zeroRates = plain;
    zeroRates.rates = SecularRates();

    for (double t : {0.0, 5.0, 77.7})
        EXPECT_EQ(orbitalPosition(plain, t), orbitalPosition(zeroRates, t));
}

TEST(OrbitalPositionCalculator, PropagatesNonConvergence)
{
    OrbitalElements el;
    el.semiMajorAxis = 1.0;
    el.eccentricity = 0.9;
    el.meanAnomalyEpoch = 1.0;
    el.period = 10.0;

    OrbitalPositionCalculator calc(el, KeplerSolver(1e-15, 1), "stiff");
    EXPECT_THROW(calc.position(0.0), NonConvergence);
    EXPECT_THROW(calc.snapshot(0.0), NonConvergence);
    EXPECT_THROW(calc.velocity(0.0), NonConvergence);
}

// ── Velocity ─────────────────────────────────────────────────────────

TEST(OrbitalVelocity, MeanMotionAndCircularSpeed)
{
    EXPECT_DOUBLE_EQ(meanMotion(1.0), kTwoPi);
    EXPECT_DOUBLE_EQ(meanMotion(-2.0), -kPi);
    EXPECT_DOUBLE_EQ(circularOrbitalSpeed(1.0, 1.0), kTwoPi);
    EXPECT_DOUBLE_EQ(circularOrbitalSpeed(3.0, -6.0), kPi);
    EXPECT_THROW(meanMotion(0.0), std::invalid_argument);
}

TEST(OrbitalVelocity, CircularOrbitAtPeriapsis)
{
    OrbitalElements el;
    el.semiMajorAxis = 1.0;
    el.period = 1.0;

    const Vec3 v = orbitalVelocity(el, 0.0);
    EXPECT_NEAR(v.x, 0.0, 1e-12);
    EXPECT_NEAR(v.y, kTwoPi, 1e-12);
    EXPECT_NEAR(v.z, 0.0, 1e-12);

    el.period = -1.0;
    const Vec3 back = orbitalVelocity(el, 0.0);
    EXPECT_NEAR(back.x, 0.0, 1e-12);
    EXPECT_NEAR(back.y, -kTwoPi, 1e-12);
}

TEST(OrbitalVelocity, MatchesFiniteDifference)
{
    const OrbitalElements el = tiltedBody();
    const double h = 1e-5;
    for (double t : {5.0, 8.3, 17.0}) {
        const Vec3 numeric = (orbitalPosition(el, t + h) - orbitalPosition(el, t - h)) / (2.0 * h);
        const Vec3 v = orbitalVelocity(el, t);
        EXPECT_NEAR(v.x, numeric.x, 1e-6);
        EXPECT_NEAR(v.y, numeric.y, 1e-6);
        EXPECT_NEAR(v.z, numeric.z, 1e-6);
    }
}

TEST(OrbitalVelocity, VisVivaAtApsides)
{
    // v^2 = mu (2/r - 1/a) with mu = n^2 a^3
    const OrbitalElements el = eccentricBody();
    const double n = meanMotion(el.period);
    const double mu = n * n;
    const double vPeri = glm::length(orbitalVelocity(el, 0.0));
    const double vApo = glm::length(orbitalVelocity(el, 0.5));
    EXPECT_NEAR(vPeri, std::sqrt(mu * (2.0 / 0.8 - 1.0)), 1e-9);
    EXPECT_NEAR(vApo, std::sqrt(mu * (2.0 / 1.2 - 1.0)), 1e-9);

    OrbitalPositionCalculator calc(el);
    EXPECT_EQ(calc.velocity(0.25), orbitalVelocity(el, 0.25));
}
