#include <Orrery/OrbitalElements.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <plog/Log.h>
#include <cmath>

namespace Orrery {

namespace {

void requireFinite(double value, const char* field, const std::string& bodyId) {
    if (!std::isfinite(value))
        throw InvalidElements(field, std::string(field) + " must be finite", bodyId);
}

} // anonymous namespace

double normalizeAngle(double radians) {
    double a = std::fmod(radians, kTwoPi);
    if (a < 0.0) a += kTwoPi;
    // fmod of a tiny negative value can round up to exactly 2*pi
    if (a >= kTwoPi) a = 0.0;
    return a;
}

void validateElements(const OrbitalElements& elements, const std::string& bodyId) {
    requireFinite(elements.semiMajorAxis, "semiMajorAxis", bodyId);
    requireFinite(elements.eccentricity, "eccentricity", bodyId);
    requireFinite(elements.inclination, "inclination", bodyId);
    requireFinite(elements.longAscNode, "longAscNode", bodyId);
    requireFinite(elements.argPeriapsis, "argPeriapsis", bodyId);
    requireFinite(elements.meanAnomalyEpoch, "meanAnomalyEpoch", bodyId);
    requireFinite(elements.period, "period", bodyId);
    requireFinite(elements.referenceEpoch, "referenceEpoch", bodyId);

    if (elements.semiMajorAxis <= 0.0) {
        PLOGW << "Rejecting elements" << (bodyId.empty() ? "" : " of '" + bodyId + "'")
              << ": semiMajorAxis=" << elements.semiMajorAxis;
        throw InvalidElements("semiMajorAxis",
            "semiMajorAxis must be positive, got " + std::to_string(elements.semiMajorAxis), bodyId);
    }
    if (elements.eccentricity < 0.0 || elements.eccentricity >= 1.0) {
        PLOGW << "Rejecting elements" << (bodyId.empty() ? "" : " of '" + bodyId + "'")
              << ": eccentricity=" << elements.eccentricity;
        throw InvalidElements("eccentricity",
            "eccentricity must be in [0, 1), got " + std::to_string(elements.eccentricity), bodyId);
    }
    if (elements.period == 0.0) {
        PLOGW << "Rejecting elements" << (bodyId.empty() ? "" : " of '" + bodyId + "'") << ": zero period";
        throw InvalidElements("period", "period must be non-zero", bodyId);
    }

    if (elements.rates) {
        const SecularRates& r = *elements.rates;
        requireFinite(r.semiMajorAxis, "rates.semiMajorAxis", bodyId);
        requireFinite(r.eccentricity, "rates.eccentricity", bodyId);
        requireFinite(r.inclination, "rates.inclination", bodyId);
        requireFinite(r.longAscNode, "rates.longAscNode", bodyId);
        requireFinite(r.argPeriapsis, "rates.argPeriapsis", bodyId);
        requireFinite(r.interval, "rates.interval", bodyId);
        if (r.interval <= 0.0)
            throw InvalidElements("rates.interval", "rate interval must be positive", bodyId);
    }
}

OrbitalElements normalizedElements(const OrbitalElements& elements) {
    OrbitalElements out = elements;
    out.inclination = normalizeAngle(elements.inclination);
    out.longAscNode = normalizeAngle(elements.longAscNode);
    out.argPeriapsis = normalizeAngle(elements.argPeriapsis);
    out.meanAnomalyEpoch = normalizeAngle(elements.meanAnomalyEpoch);
    return out;
}

} // namespace Orrery
