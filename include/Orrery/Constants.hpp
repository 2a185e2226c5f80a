#pragma once
#include <glm/glm.hpp>

namespace Orrery {

// Positions are in the length unit of the semi-major axes, in the parent's frame.
using Vec3 = glm::dvec3;

constexpr double kPi = 3.141592653589793238462643383279502884;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;

// Time scale anchors (Julian Dates, days)
constexpr double kJ2000 = 2451545.0;              // 2000-01-01T12:00:00 TT
constexpr double kUnixEpochJulianDate = 2440587.5; // 1970-01-01T00:00:00 UTC
constexpr double kDaysPerJulianCentury = 36525.0;
constexpr double kDaysPerJulianYear = 365.25;
constexpr double kSecondsPerDay = 86400.0;

// Length
constexpr double kKmPerAU = 149597870.7;

} // namespace Orrery
