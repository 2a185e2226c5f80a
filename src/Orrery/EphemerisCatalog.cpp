#include <Orrery/EphemerisCatalog.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace Orrery::EphemerisCatalog {

namespace {

// Source: https://ssd.jpl.nasa.gov/planets/approx_pos.html, table 1 (1800 AD - 2050 AD)
const std::vector<JplPlanetRecord> kRecords = {
    {"mercury", "Mercury",
     0.38709927, 0.20563593, 7.00497902, 48.33076593, 77.45779628, 252.25032350,
     0.00000037, 0.00001906, -0.00594749, -0.12534081, 0.16047689, 149472.67411175,
     2439.7, 58.6, 0.034},
    {"venus", "Venus",
     0.72333566, 0.00677672, 3.39467605, 76.67984255, 131.60246718, 181.97909950,
     0.00000390, -0.00004107, -0.00078890, -0.27769418, 0.00268329, 58517.81538729,
     6051.8, -243.0, 177.4},
    {"earth", "Earth",
     1.00000261, 0.01671123, -0.00001531, 0.0, 102.93768193, 100.46457166,
     0.00000562, -0.00004392, -0.01294668, 0.0, 0.32327364, 35999.37244981,
     6371.0, 1.0, 23.44},
    {"mars", "Mars",
     1.52371034, 0.09339410, 1.84969142, 49.55953891, -23.94362959, -4.55343205,
     0.00001847, 0.00007882, -0.00813131, -0.29257343, 0.44441088, 19140.30268499,
     3389.5, 1.026, 25.19},
    {"jupiter", "Jupiter",
     5.20288700, 0.04838624, 1.30439695, 100.47390909, 14.72847983, 34.39644051,
     -0.00011607, -0.00013253, -0.00183714, 0.20469106, 0.21252668, 3034.74612775,
     69911.0, 0.41, 3.13},
    {"saturn", "Saturn",
     9.53667594, 0.05386179, 2.48599187, 113.66242448, 92.59887831, 49.95424423,
     -0.00125060, -0.00050991, 0.00193609, -0.28867794, -0.41897216, 1222.49362201,
     58232.0, 0.45, 26.73},
    {"uranus", "Uranus",
     19.18916464, 0.04725744, 0.77263783, 74.01692503, 170.95427630, 313.23810451,
     -0.00196176, -0.00004397, -0.00242939, 0.04240589, 0.40805281, 428.48202785,
     25362.0, -0.72, 97.77},
    {"neptune", "Neptune",
     30.06992276, 0.00859048, 1.77004347, 131.78422574, 44.96476227, -55.12002969,
     0.00026291, 0.00005105, 0.00035372, -0.00508664, -0.32241464, 218.45945325,
     24622.0, 0.67, 28.32},
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

const std::vector<JplPlanetRecord>& jplPlanetRecords() {
    return kRecords;
}

OrbitalElements toOrbitalElements(const JplPlanetRecord& r) {
    OrbitalElements el;
    el.semiMajorAxis = r.a;
    el.eccentricity = r.e;
    el.inclination = normalizeAngle(r.i * kDegToRad);
    el.longAscNode = normalizeAngle(r.Omega * kDegToRad);
    el.argPeriapsis = normalizeAngle((r.varpi - r.Omega) * kDegToRad);
    el.meanAnomalyEpoch = normalizeAngle((r.L - r.varpi) * kDegToRad);
    el.period = 360.0 * kDaysPerJulianCentury / (r.LDot - r.varpiDot);
    el.referenceEpoch = kJ2000;

    SecularRates rates;
    rates.semiMajorAxis = r.aDot;
    rates.eccentricity = r.eDot;
    rates.inclination = r.iDot * kDegToRad;
    rates.longAscNode = r.OmegaDot * kDegToRad;
    rates.argPeriapsis = (r.varpiDot - r.OmegaDot) * kDegToRad;
    rates.interval = kDaysPerJulianCentury;
    el.rates = rates;
    return el;
}

const JplPlanetRecord& planetRecord(const std::string& name) {
    const std::string key = toLower(name);
    for (const auto& r : kRecords)
        if (r.name == key) return r;
    throw std::out_of_range("EphemerisCatalog: no planet named '" + name + "'");
}

OrbitalElements planetElements(const std::string& name) {
    return toOrbitalElements(planetRecord(name));
}

std::vector<CelestialBody> solarSystemBodies() {
    std::vector<CelestialBody> bodies;
    bodies.reserve(kRecords.size() + 1);

    CelestialBody sun;
    sun.id = "sun";
    sun.name = "Sun";
    sun.bodyType = BodyType::Star;
    sun.radius = 695700.0;
    sun.rotationPeriod = 25.38;
    sun.axialTilt = 7.25 * kDegToRad;
    bodies.push_back(std::move(sun));

    for (const auto& r : kRecords) {
        CelestialBody b;
        b.id = r.name;
        b.parentId = std::string("sun");
        b.name = r.displayName;
        b.bodyType = BodyType::Planet;
        b.elements = toOrbitalElements(r);
        b.radius = r.radiusKm;
        b.rotationPeriod = r.rotationPeriodDays;
        b.axialTilt = r.axialTiltDeg * kDegToRad;
        bodies.push_back(std::move(b));
    }
    return bodies;
}

} // namespace Orrery::EphemerisCatalog
