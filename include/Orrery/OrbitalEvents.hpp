#pragma once
#include <Orrery/Constants.hpp>

// Phase-angle bookkeeping for simple orbital events (conjunctions,
// oppositions, "time until the body reaches angle X"). Angles in radians,
// times in the period's unit.
namespace Orrery::OrbitalEvents {

// Mean orbital angle after `elapsed`, wrapped into [0, 2*pi). A negative
// period turns the angle clockwise.
double orbitalAngle(double elapsed, double period, double startAngle = 0.0);

// Time until the orbital angle moves from `currentAngle` to `targetAngle`,
// travelling in the orbit's direction. Always in [0, |period|).
double timeToOrbitalEvent(double currentAngle, double targetAngle, double period);

// Smallest angle between two directions, in [0, pi].
double angularSeparation(double angle1, double angle2);

// Both bodies on the same side of the parent, within `threshold`.
bool isConjunction(double angle1, double angle2, double threshold = kPi / 12.0);

// Bodies on opposite sides of the parent, within `threshold`.
bool isOpposition(double angle1, double angle2, double threshold = kPi / 12.0);

} // namespace Orrery::OrbitalEvents
