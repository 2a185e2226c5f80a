#include <Orrery/OrbitPathSampler.hpp>
#include <Orrery/AnomalyConverter.hpp>
#include <Orrery/EpochClock.hpp>
#include <Orrery/FrameRotator.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Orrery::OrbitPathSampler {

std::vector<Vec3> samplePath(const OrbitalElements& elements, int segmentCount) {
    if (segmentCount < 1)
        throw std::invalid_argument("samplePath: segmentCount must be at least 1, got " + std::to_string(segmentCount));

    const double a = elements.semiMajorAxis;
    const double e = elements.eccentricity;
    const PlaneRotation rotation(elements.argPeriapsis, elements.inclination, elements.longAscNode);

    std::vector<Vec3> out;
    out.reserve(static_cast<size_t>(segmentCount) + 1);

    for (int s = 0; s <= segmentCount; ++s) {
        const double nu = kTwoPi * static_cast<double>(s) / static_cast<double>(segmentCount);
        const double r = AnomalyConverter::radiusAtTrueAnomaly(a, e, nu);
        out.push_back(rotation.apply(r * std::cos(nu), r * std::sin(nu)));
    }
    return out;
}

std::vector<Vec3> samplePathAt(const OrbitalElements& elements, double simulationTime, int segmentCount) {
    return samplePath(EpochClock::elementsAt(elements, simulationTime), segmentCount);
}

} // namespace Orrery::OrbitPathSampler
