#pragma once
#include <Orrery/OrbitalElements.hpp>
#include <chrono>
#include <cstdint>

// Time bookkeeping between a pushed-in simulation time and an element
// set's reference epoch. Nothing in here reads a clock.
namespace Orrery::EpochClock {

// Elapsed time since the elements' reference epoch, in the period's time unit.
double timeSinceEpoch(const OrbitalElements& elements, double simulationTime);

// `elapsed` expressed in rate intervals (0 when the elements carry no rates).
double rateUnitsElapsed(const OrbitalElements& elements, double elapsed);

/**
 * @brief Elements valid `elapsedRateUnits` rate intervals after the epoch
 *
 * Each rated field becomes value + rate * elapsedRateUnits and the angles
 * are re-normalized. Without rates the input is returned unchanged. The
 * result carries the same rates and epoch as the input.
 */
OrbitalElements applySecularRates(const OrbitalElements& elements, double elapsedRateUnits);

/**
 * @brief Elements in effect at `simulationTime`
 *
 * Angles are normalized first, then the secular rates are applied, so an
 * already-normalized copy and the raw input give bit-identical results.
 * Throws InvalidElements when drift has moved a to <= 0 or e out of [0, 1).
 */
OrbitalElements elementsAt(const OrbitalElements& elements, double simulationTime);

// ── Julian Date helpers ──────────────────────────────────────────────
double julianDateFromUnixMillis(int64_t unixMillis);
double julianDateFromTimePoint(std::chrono::system_clock::time_point tp);
double daysSinceJ2000(double julianDate);
double centuriesSinceJ2000(double julianDate);

} // namespace Orrery::EpochClock
