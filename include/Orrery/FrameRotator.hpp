#pragma once
#include <Orrery/Constants.hpp>

namespace Orrery {

// ── Orbital plane -> reference frame ─────────────────────────────────
// Reference frame: right-handed, +X toward the reference direction (vernal
// equinox), +Z along the reference pole (ecliptic north), +Y 90 degrees east
// of +X in the reference plane. Orbital-plane input has periapsis on +X and
// z = 0.
//
// Rotations are applied in this order:
//   1. argument of periapsis (omega) about the orbital-plane normal (Z)
//   2. inclination (i) about the line of nodes (X)
//   3. longitude of ascending node (Omega) about the reference pole (Z)
namespace FrameRotator {

Vec3 rotate(double xOrbit, double yOrbit, double argPeriapsis, double inclination, double longAscNode);

} // namespace FrameRotator

/**
 * @brief One (omega, i, Omega) rotation with its trig precomputed
 *
 * Applies the same three steps as FrameRotator::rotate to many points of
 * one orbit; results are bit-identical to the free function.
 */
class PlaneRotation {
public:
    PlaneRotation(double argPeriapsis, double inclination, double longAscNode);

    Vec3 apply(double xOrbit, double yOrbit) const;

private:
    double m_cosW, m_sinW;
    double m_cosI, m_sinI;
    double m_cosO, m_sinO;
};

} // namespace Orrery
