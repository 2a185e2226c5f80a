#pragma once
#include <Orrery/CelestialBody.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <string>
#include <vector>

namespace Orrery {

/**
 * @brief One row of the JPL "approximate positions of the major planets" table
 *
 * Keplerian elements at J2000 with their rates per Julian century, valid for
 * 1800-2050 AD. Angles in degrees, lengths in AU, as published.
 */
struct JplPlanetRecord {
    std::string name;       // lowercase key, e.g. "earth"
    std::string displayName;

    double a;       // semi-major axis (AU)
    double e;       // eccentricity
    double i;       // inclination (deg)
    double Omega;   // longitude of ascending node (deg)
    double varpi;   // longitude of perihelion (deg)
    double L;       // mean longitude (deg)

    double aDot, eDot, iDot, OmegaDot, varpiDot, LDot;  // per century

    // Physical payload (km, days, deg)
    double radiusKm;
    double rotationPeriodDays;
    double axialTiltDeg;
};

namespace EphemerisCatalog {

// Mercury through Neptune, in order from the Sun.
const std::vector<JplPlanetRecord>& jplPlanetRecords();

/**
 * @brief Convert a published record into engine elements
 *
 * omega = varpi - Omega, M0 = L - varpi, period (days) from the mean-anomaly
 * rate LDot - varpiDot. Reference epoch is J2000 and the rates are expressed
 * per Julian century (interval 36525 days). Output angles in radians, lengths
 * in AU, times in days.
 */
OrbitalElements toOrbitalElements(const JplPlanetRecord& record);

// Elements of a planet by name, case-insensitive. Throws std::out_of_range.
OrbitalElements planetElements(const std::string& name);

// Raw record by name, case-insensitive. Throws std::out_of_range.
const JplPlanetRecord& planetRecord(const std::string& name);

// The Sun (id "sun") as root and the eight planets orbiting it, ready for BodyGraph.
std::vector<CelestialBody> solarSystemBodies();

} // namespace EphemerisCatalog
} // namespace Orrery
