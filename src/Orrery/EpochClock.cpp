#include <Orrery/EpochClock.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <plog/Log.h>
#include <string>

namespace Orrery::EpochClock {

namespace {

// Rates are linear, so a long enough horizon can push the shape out of the
// elliptical regime even though the epoch values were valid.
void checkDrift(const OrbitalElements& corrected, double simulationTime) {
    if (corrected.semiMajorAxis <= 0.0) {
        PLOGE << "Secular drift made semiMajorAxis non-positive at t=" << simulationTime;
        throw InvalidElements("semiMajorAxis",
            "secular drift made semiMajorAxis non-positive at t=" + std::to_string(simulationTime));
    }
    if (corrected.eccentricity < 0.0 || corrected.eccentricity >= 1.0) {
        PLOGE << "Secular drift moved eccentricity to " << corrected.eccentricity << " at t=" << simulationTime;
        throw InvalidElements("eccentricity",
            "secular drift moved eccentricity out of [0, 1) at t=" + std::to_string(simulationTime));
    }
}

} // anonymous namespace

double timeSinceEpoch(const OrbitalElements& elements, double simulationTime) {
    return simulationTime - elements.referenceEpoch;
}

double rateUnitsElapsed(const OrbitalElements& elements, double elapsed) {
    if (!elements.rates) return 0.0;
    return elapsed / elements.rates->interval;
}

OrbitalElements applySecularRates(const OrbitalElements& elements, double elapsedRateUnits) {
    if (!elements.rates) return elements;

    const SecularRates& r = *elements.rates;
    OrbitalElements out = elements;
    out.semiMajorAxis = elements.semiMajorAxis + r.semiMajorAxis * elapsedRateUnits;
    out.eccentricity  = elements.eccentricity + r.eccentricity * elapsedRateUnits;
    out.inclination   = normalizeAngle(elements.inclination + r.inclination * elapsedRateUnits);
    out.longAscNode   = normalizeAngle(elements.longAscNode + r.longAscNode * elapsedRateUnits);
    out.argPeriapsis  = normalizeAngle(elements.argPeriapsis + r.argPeriapsis * elapsedRateUnits);
    out.meanAnomalyEpoch = normalizeAngle(elements.meanAnomalyEpoch);
    return out;
}

OrbitalElements elementsAt(const OrbitalElements& elements, double simulationTime) {
    const OrbitalElements base = normalizedElements(elements);
    if (!base.rates) return base;

    const double units = rateUnitsElapsed(base, timeSinceEpoch(base, simulationTime));
    OrbitalElements corrected = applySecularRates(base, units);
    checkDrift(corrected, simulationTime);
    return corrected;
}

double julianDateFromUnixMillis(int64_t unixMillis) {
    return kUnixEpochJulianDate + static_cast<double>(unixMillis) / (kSecondsPerDay * 1000.0);
}

double julianDateFromTimePoint(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    return julianDateFromUnixMillis(static_cast<int64_t>(ms));
}

double daysSinceJ2000(double julianDate) {
    return julianDate - kJ2000;
}

double centuriesSinceJ2000(double julianDate) {
    return daysSinceJ2000(julianDate) / kDaysPerJulianCentury;
}

} // namespace Orrery::EpochClock
