#include <Orrery/FrameRotator.hpp>
#include <cmath>

namespace Orrery {

PlaneRotation::PlaneRotation(double argPeriapsis, double inclination, double longAscNode)
    : m_cosW(std::cos(argPeriapsis)), m_sinW(std::sin(argPeriapsis)),
      m_cosI(std::cos(inclination)), m_sinI(std::sin(inclination)),
      m_cosO(std::cos(longAscNode)), m_sinO(std::sin(longAscNode)) {}

Vec3 PlaneRotation::apply(double xOrbit, double yOrbit) const {
    // 1. omega about Z, still in the orbital plane
    const double x1 = xOrbit * m_cosW - yOrbit * m_sinW;
    const double y1 = xOrbit * m_sinW + yOrbit * m_cosW;

    // 2. tilt by i about the line of nodes (z1 = 0)
    const double x2 = x1;
    const double y2 = y1 * m_cosI;
    const double z2 = y1 * m_sinI;

    // 3. Omega about the reference pole
    const double x3 = x2 * m_cosO - y2 * m_sinO;
    const double y3 = x2 * m_sinO + y2 * m_cosO;

    return Vec3(x3, y3, z2);
}

namespace FrameRotator {

Vec3 rotate(double xOrbit, double yOrbit, double argPeriapsis, double inclination, double longAscNode) {
    return PlaneRotation(argPeriapsis, inclination, longAscNode).apply(xOrbit, yOrbit);
}

} // namespace FrameRotator

} // namespace Orrery
