#pragma once
#include <Orrery/Constants.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <vector>

// Static orbit geometry for drawing orbit lines. Sweeps the true anomaly
// uniformly and uses the closed-form orbit equation, so no Kepler solve is
// involved and there is no failure mode besides a bad segment count.
namespace Orrery::OrbitPathSampler {

/**
 * @brief `segmentCount + 1` points tracing one full orbit
 *
 * Point k sits at true anomaly 2*pi*k/segmentCount; the last point closes
 * the loop on the first. Points are in the parent frame. Throws
 * std::invalid_argument for segmentCount < 1.
 */
std::vector<Vec3> samplePath(const OrbitalElements& elements, int segmentCount);

// Same as samplePath, with the shape taken after secular rates are applied
// at `simulationTime`.
std::vector<Vec3> samplePathAt(const OrbitalElements& elements, double simulationTime, int segmentCount);

} // namespace Orrery::OrbitPathSampler
