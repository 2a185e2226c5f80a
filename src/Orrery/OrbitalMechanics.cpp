#include <Orrery/OrbitalMechanics.hpp>
#include <Orrery/AnomalyConverter.hpp>
#include <Orrery/EpochClock.hpp>
#include <Orrery/FrameRotator.hpp>
#include <cmath>
#include <stdexcept>

namespace Orrery {

OrbitSnapshot describeOrbit(const OrbitalElements& elements, double simulationTime, const KeplerSolver& solver) {
    const double elapsed = EpochClock::timeSinceEpoch(elements, simulationTime);
    const OrbitalElements corrected = EpochClock::elementsAt(elements, simulationTime);

    const double a = corrected.semiMajorAxis;
    const double e = corrected.eccentricity;

    // Mean motion keeps the sign of the period: negative = retrograde
    const double n = kTwoPi / corrected.period;
    const double M = normalizeAngle(corrected.meanAnomalyEpoch + n * elapsed);

    const double E = solver.solve(M, e);
    const double nu = AnomalyConverter::trueAnomaly(E, e);
    const double r = AnomalyConverter::radius(a, e, E);

    // Position in orbital plane (periapsis along x)
    const double xOrb = r * std::cos(nu);
    const double yOrb = r * std::sin(nu);

    OrbitSnapshot snap;
    snap.position = FrameRotator::rotate(xOrb, yOrb, corrected.argPeriapsis,
                                         corrected.inclination, corrected.longAscNode);
    snap.distance = r;
    snap.meanAnomaly = M;
    snap.eccentricAnomaly = E;
    snap.trueAnomaly = nu;
    snap.periapsis = periapsisDistance(a, e);
    snap.apoapsis = apoapsisDistance(a, e);
    snap.elements = corrected;
    return snap;
}

Vec3 orbitalPosition(const OrbitalElements& elements, double simulationTime, const KeplerSolver& solver) {
    return describeOrbit(elements, simulationTime, solver).position;
}

double periapsisDistance(double semiMajorAxis, double eccentricity) {
    return semiMajorAxis * (1.0 - eccentricity);
}

double apoapsisDistance(double semiMajorAxis, double eccentricity) {
    return semiMajorAxis * (1.0 + eccentricity);
}

double meanMotion(double period) {
    if (period == 0.0) throw std::invalid_argument("meanMotion: period must be non-zero");
    return kTwoPi / period;
}

double circularOrbitalSpeed(double radius, double period) {
    return std::fabs(radius * meanMotion(period));
}

Vec3 orbitalVelocity(const OrbitalElements& elements, double simulationTime, const KeplerSolver& solver) {
    const double elapsed = EpochClock::timeSinceEpoch(elements, simulationTime);
    const OrbitalElements corrected = EpochClock::elementsAt(elements, simulationTime);

    const double a = corrected.semiMajorAxis;
    const double e = corrected.eccentricity;
    const double n = meanMotion(corrected.period);
    const double E = solver.solve(normalizeAngle(corrected.meanAnomalyEpoch + n * elapsed), e);

    // dE/dt = n / (1 - e cos E); perifocal velocity, periapsis along x
    const double factor = a * n / (1.0 - e * std::cos(E));
    const double vxOrb = -factor * std::sin(E);
    const double vyOrb = factor * std::sqrt(1.0 - e * e) * std::cos(E);

    return PlaneRotation(corrected.argPeriapsis, corrected.inclination, corrected.longAscNode)
        .apply(vxOrb, vyOrb);
}

// ── OrbitalPositionCalculator ────────────────────────────────────────

OrbitalPositionCalculator::OrbitalPositionCalculator(const OrbitalElements& elements,
                                                     const KeplerSolver& solver,
                                                     const std::string& bodyId)
    : m_elements(elements), m_solver(solver) {
    validateElements(elements, bodyId);
    m_elements = normalizedElements(elements);
}

Vec3 OrbitalPositionCalculator::position(double simulationTime) const {
    return orbitalPosition(m_elements, simulationTime, m_solver);
}

OrbitSnapshot OrbitalPositionCalculator::snapshot(double simulationTime) const {
    return describeOrbit(m_elements, simulationTime, m_solver);
}

Vec3 OrbitalPositionCalculator::velocity(double simulationTime) const {
    return orbitalVelocity(m_elements, simulationTime, m_solver);
}

} // namespace Orrery
