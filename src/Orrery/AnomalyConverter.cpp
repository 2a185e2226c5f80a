#include <Orrery/AnomalyConverter.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <cmath>

namespace Orrery::AnomalyConverter {

double trueAnomaly(double eccentricAnomaly, double eccentricity) {
    const double y = std::sqrt(1.0 + eccentricity) * std::sin(eccentricAnomaly / 2.0);
    const double x = std::sqrt(1.0 - eccentricity) * std::cos(eccentricAnomaly / 2.0);
    return 2.0 * std::atan2(y, x);
}

double radius(double semiMajorAxis, double eccentricity, double eccentricAnomaly) {
    return semiMajorAxis * (1.0 - eccentricity * std::cos(eccentricAnomaly));
}

double radiusAtTrueAnomaly(double semiMajorAxis, double eccentricity, double trueAnomaly) {
    const double p = semiMajorAxis * (1.0 - eccentricity * eccentricity);
    return p / (1.0 + eccentricity * std::cos(trueAnomaly));
}

double meanLongitudeToMeanAnomaly(double meanLongitude, double longitudeOfPeriapsis) {
    return normalizeAngle(meanLongitude - longitudeOfPeriapsis);
}

} // namespace Orrery::AnomalyConverter
