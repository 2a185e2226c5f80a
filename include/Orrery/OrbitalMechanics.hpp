#pragma once
#include <Orrery/Constants.hpp>
#include <Orrery/KeplerSolver.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <string>

namespace Orrery {

// ── Full state of one orbit at one instant ───────────────────────────
struct OrbitSnapshot {
    Vec3 position{0.0};             // parent frame, semi-major-axis unit
    double distance = 0.0;          // |position|
    double meanAnomaly = 0.0;       // rad, [0, 2*pi)
    double eccentricAnomaly = 0.0;  // rad
    double trueAnomaly = 0.0;       // rad, (-pi, pi]
    double periapsis = 0.0;         // of the rate-corrected orbit
    double apoapsis = 0.0;
    OrbitalElements elements;       // rate-corrected elements the state was computed from
};

/**
 * @brief Position of a body at `simulationTime`, relative to its parent
 *
 * Elapsed time since the reference epoch -> secular rates -> mean anomaly
 * (mean motion 2*pi/period keeps the sign of the period) -> Kepler's
 * equation -> true anomaly and radius -> rotation into the parent frame.
 *
 * The elements are assumed to have passed validateElements(); use
 * OrbitalPositionCalculator to validate once and query many times.
 * Throws NonConvergence from the solver, and InvalidElements if secular
 * drift has moved a or e out of range at this time.
 */
Vec3 orbitalPosition(const OrbitalElements& elements, double simulationTime,
                     const KeplerSolver& solver = KeplerSolver());

OrbitSnapshot describeOrbit(const OrbitalElements& elements, double simulationTime,
                            const KeplerSolver& solver = KeplerSolver());

// Closest / farthest distance from the focus.
double periapsisDistance(double semiMajorAxis, double eccentricity);
double apoapsisDistance(double semiMajorAxis, double eccentricity);

// Mean angular rate 2*pi/period (rad per time unit), negative for retrograde.
// Throws std::invalid_argument for a zero period.
double meanMotion(double period);

// Speed along a circular orbit, 2*pi*r/|period|.
double circularOrbitalSpeed(double radius, double period);

/**
 * @brief Velocity relative to the parent at `simulationTime`
 *
 * Derivative of orbitalPosition with the elements held at their values for
 * that instant; the secular drift itself is not differentiated. Length unit
 * of the semi-major axis per time unit of the period.
 */
Vec3 orbitalVelocity(const OrbitalElements& elements, double simulationTime,
                     const KeplerSolver& solver = KeplerSolver());

/**
 * @brief Validated orbit ready for per-frame queries
 *
 * Construction checks the element invariants (InvalidElements) and keeps
 * a normalized copy; position() does no further validation.
 */
class OrbitalPositionCalculator {
public:
    explicit OrbitalPositionCalculator(const OrbitalElements& elements,
                                       const KeplerSolver& solver = KeplerSolver(),
                                       const std::string& bodyId = "");

    Vec3 position(double simulationTime) const;
    OrbitSnapshot snapshot(double simulationTime) const;
    Vec3 velocity(double simulationTime) const;

    const OrbitalElements& elements() const { return m_elements; }
    const KeplerSolver& solver() const { return m_solver; }

private:
    OrbitalElements m_elements;
    KeplerSolver m_solver;
};

} // namespace Orrery
