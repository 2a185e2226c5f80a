#include <Orrery/OrbitalEvents.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <cmath>
#include <stdexcept>

namespace Orrery::OrbitalEvents {

double orbitalAngle(double elapsed, double period, double startAngle) {
    if (period == 0.0) throw std::invalid_argument("orbitalAngle: period must be non-zero");
    return normalizeAngle(startAngle + (elapsed / period) * kTwoPi);
}

double timeToOrbitalEvent(double currentAngle, double targetAngle, double period) {
    if (period == 0.0) throw std::invalid_argument("timeToOrbitalEvent: period must be non-zero");

    // Retrograde bodies reach the target by decreasing angle
    double delta = (period > 0.0) ? targetAngle - currentAngle : currentAngle - targetAngle;
    delta = normalizeAngle(delta);
    return (delta / kTwoPi) * std::fabs(period);
}

double angularSeparation(double angle1, double angle2) {
    double diff = normalizeAngle(angle1 - angle2);
    return (diff > kPi) ? kTwoPi - diff : diff;
}

bool isConjunction(double angle1, double angle2, double threshold) {
    return angularSeparation(angle1, angle2) < threshold;
}

bool isOpposition(double angle1, double angle2, double threshold) {
    return std::fabs(angularSeparation(angle1, angle2) - kPi) < threshold;
}

} // namespace Orrery::OrbitalEvents
