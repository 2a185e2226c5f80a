#pragma once
#include <Orrery/Constants.hpp>
#include <optional>
#include <string>

namespace Orrery {

// ── Secular rates ────────────────────────────────────────────────────
// Linear drift of the shape/orientation elements. Each rate is the change
// per `interval` time units, where the time unit is the one `period` and
// `referenceEpoch` are expressed in (e.g. interval = 36525 for rates per
// Julian century when periods are in days).
struct SecularRates {
    double semiMajorAxis = 0.0;
    double eccentricity  = 0.0;
    double inclination   = 0.0;   // rad per interval
    double longAscNode   = 0.0;   // rad per interval
    double argPeriapsis  = 0.0;   // rad per interval
    double interval      = 1.0;
};

// ── Keplerian orbital elements ───────────────────────────────────────
// One body's orbit relative to its parent. Angles in radians.
struct OrbitalElements {
    double semiMajorAxis    = 1.0;  // > 0, parent length unit
    double eccentricity     = 0.0;  // 0 = circular, <1 = elliptical
    double inclination      = 0.0;  // relative to reference plane; > pi/2 is retrograde-plane
    double longAscNode      = 0.0;  // longitude of ascending node (Omega)
    double argPeriapsis     = 0.0;  // argument of periapsis (omega)
    double meanAnomalyEpoch = 0.0;  // mean anomaly at referenceEpoch
    double period           = 1.0;  // time units; negative = retrograde (clockwise) motion
    double referenceEpoch   = 0.0;  // instant the values above are valid, same scale as simulation time

    std::optional<SecularRates> rates;
};

// Wrap an angle into [0, 2*pi). Idempotent for values already in range.
double normalizeAngle(double radians);

/**
 * @brief Check the invariants of an element set
 *
 * a > 0, 0 <= e < 1, period != 0, every field finite, rate interval > 0.
 * Throws InvalidElements naming the first offending field; `bodyId` is only
 * used to make the message useful to a loader.
 */
void validateElements(const OrbitalElements& elements, const std::string& bodyId = "");

// Copy of `elements` with every angle wrapped into [0, 2*pi).
OrbitalElements normalizedElements(const OrbitalElements& elements);

} // namespace Orrery
