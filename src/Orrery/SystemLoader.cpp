#include <Orrery/SystemLoader.hpp>
#include <Orrery/EphemerisCatalog.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <plog/Log.h>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace Orrery {

namespace {

enum class Quantity { Length, Angle, Time, Scalar };

// Conversion factors from the file's default units to the engine's.
struct UnitContext {
    double metersPerLength = 1.0;
    double daysPerTime = 1.0;
    double radiansPerAngle = 1.0;
};

double readNumber(const nlohmann::json& obj, const char* key, Quantity q,
                  const UnitContext& ctx, const std::string& where) {
    const auto& v = obj.at(key);
    double value = 0.0;
    std::string unit;
    if (v.is_number()) {
        value = v.get<double>();
    } else if (v.is_object() && v.contains("value") && v["value"].is_number()) {
        value = v["value"].get<double>();
        unit = v.value("unit", "");
    } else {
        throw SystemLoadError(where + ": '" + key + "' must be a number or {value, unit}");
    }

    switch (q) {
        case Quantity::Length:
            return unit.empty() ? value : value * SystemLoader::metersPerLengthUnit(unit) / ctx.metersPerLength;
        case Quantity::Time:
            return unit.empty() ? value : value * SystemLoader::daysPerTimeUnit(unit) / ctx.daysPerTime;
        case Quantity::Angle:
            return value * (unit.empty() ? ctx.radiansPerAngle : SystemLoader::radiansPerAngleUnit(unit));
        case Quantity::Scalar:
            if (!unit.empty()) throw SystemLoadError(where + ": '" + key + "' takes no unit");
            return value;
    }
    return value;
}

double optionalNumber(const nlohmann::json& obj, const char* key, Quantity q,
                      const UnitContext& ctx, const std::string& where, double fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    return readNumber(obj, key, q, ctx, where);
}

double requiredNumber(const nlohmann::json& obj, const char* key, Quantity q,
                      const UnitContext& ctx, const std::string& where) {
    if (!obj.contains(key)) throw SystemLoadError(where + ": missing '" + key + "'");
    return readNumber(obj, key, q, ctx, where);
}

SecularRates parseRates(const nlohmann::json& r, const UnitContext& ctx, const std::string& where) {
    if (!r.is_object()) throw SystemLoadError(where + ": 'rates' must be an object");
    SecularRates rates;
    rates.semiMajorAxis = optionalNumber(r, "semiMajorAxis", Quantity::Length, ctx, where, 0.0);
    rates.eccentricity = optionalNumber(r, "eccentricity", Quantity::Scalar, ctx, where, 0.0);
    rates.inclination = optionalNumber(r, "inclination", Quantity::Angle, ctx, where, 0.0);
    rates.longAscNode = optionalNumber(r, "longAscNode", Quantity::Angle, ctx, where, 0.0);
    rates.argPeriapsis = optionalNumber(r, "argPeriapsis", Quantity::Angle, ctx, where, 0.0);
    if (r.contains("per"))
        rates.interval = SystemLoader::daysPerTimeUnit(r["per"].get<std::string>()) / ctx.daysPerTime;
    return rates;
}

OrbitalElements parseOrbit(const nlohmann::json& o, const UnitContext& ctx, double fileEpoch,
                           const std::string& where) {
    if (!o.is_object()) throw SystemLoadError(where + ": 'orbit' must be an object");
    OrbitalElements el;
    el.semiMajorAxis = requiredNumber(o, "semiMajorAxis", Quantity::Length, ctx, where);
    el.eccentricity = requiredNumber(o, "eccentricity", Quantity::Scalar, ctx, where);
    el.period = requiredNumber(o, "period", Quantity::Time, ctx, where);
    el.inclination = optionalNumber(o, "inclination", Quantity::Angle, ctx, where, 0.0);
    el.longAscNode = optionalNumber(o, "longAscNode", Quantity::Angle, ctx, where, 0.0);
    el.argPeriapsis = optionalNumber(o, "argPeriapsis", Quantity::Angle, ctx, where, 0.0);
    el.meanAnomalyEpoch = optionalNumber(o, "meanAnomalyEpoch", Quantity::Angle, ctx, where, 0.0);
    el.referenceEpoch = optionalNumber(o, "epoch", Quantity::Time, ctx, where, fileEpoch);
    if (o.contains("rates")) el.rates = parseRates(o["rates"], ctx, where);
    return el;
}

// Catalog elements are in AU and days; rescale them to the file's units.
OrbitalElements catalogOrbit(const std::string& planet, const UnitContext& ctx, const std::string& where) {
    OrbitalElements el;
    try {
        el = EphemerisCatalog::planetElements(planet);
    } catch (const std::out_of_range&) {
        throw SystemLoadError(where + ": unknown JPL planet '" + planet + "'");
    }
    const double lengthScale = kKmPerAU * 1000.0 / ctx.metersPerLength;
    el.semiMajorAxis *= lengthScale;
    el.period /= ctx.daysPerTime;
    el.referenceEpoch /= ctx.daysPerTime;
    if (el.rates) {
        el.rates->semiMajorAxis *= lengthScale;
        el.rates->interval /= ctx.daysPerTime;
    }
    return el;
}

CelestialBody parseBody(const nlohmann::json& b, const UnitContext& ctx, double fileEpoch) {
    if (!b.is_object()) throw SystemLoadError("bodies: every entry must be an object");
    if (!b.contains("id") || !b["id"].is_string() || b["id"].get<std::string>().empty())
        throw SystemLoadError("bodies: entry without a string 'id'");

    CelestialBody body;
    body.id = b["id"].get<std::string>();
    const std::string where = "body '" + body.id + "'";

    if (b.contains("parent") && !b["parent"].is_null())
        body.parentId = b["parent"].get<std::string>();

    body.name = b.value("name", body.id);
    if (b.contains("type")) {
        const std::string typeName = b["type"].get<std::string>();
        std::optional<BodyType> type = parseBodyType(typeName);
        if (!type) throw SystemLoadError(where + ": unknown body type '" + typeName + "'");
        body.bodyType = *type;
    }

    // Physical radius stays in km for the renderer unless a unit says otherwise
    if (b.contains("radius")) {
        UnitContext km = ctx;
        km.metersPerLength = 1000.0;
        body.radius = readNumber(b, "radius", Quantity::Length, km, where);
    }
    body.rotationPeriod = optionalNumber(b, "rotationPeriod", Quantity::Time, ctx, where, body.rotationPeriod);
    body.axialTilt = optionalNumber(b, "axialTilt", Quantity::Angle, ctx, where, body.axialTilt);
    if (b.contains("metadata")) body.bodyJSON = b["metadata"].dump();

    if (body.isRoot()) return body;

    if (b.contains("jpl")) {
        const std::string planet = b["jpl"].get<std::string>();
        body.elements = catalogOrbit(planet, ctx, where);
        if (!b.contains("name")) body.name = EphemerisCatalog::planetRecord(planet).displayName;
    } else if (b.contains("orbit")) {
        body.elements = parseOrbit(b["orbit"], ctx, fileEpoch, where);
    } else {
        throw SystemLoadError(where + ": needs an 'orbit' or a 'jpl' entry");
    }
    return body;
}

} // anonymous namespace

SystemLoader::SystemLoader(InvalidBodyPolicy policy, const KeplerSolver& solver)
    : m_policy(policy), m_solver(solver) {}

SystemLoader::SystemLoader(const EngineConfig& config)
    : m_policy(config.invalidBodyPolicy), m_solver(config.makeSolver()) {}

double SystemLoader::metersPerLengthUnit(const std::string& unit) {
    if (unit == "AU" || unit == "au") return kKmPerAU * 1000.0;
    if (unit == "km") return 1000.0;
    if (unit == "m") return 1.0;
    throw SystemLoadError("unknown length unit '" + unit + "'");
}

double SystemLoader::daysPerTimeUnit(const std::string& unit) {
    if (unit == "day" || unit == "d") return 1.0;
    if (unit == "hour" || unit == "h") return 1.0 / 24.0;
    if (unit == "minute" || unit == "min") return 1.0 / 1440.0;
    if (unit == "second" || unit == "s") return 1.0 / kSecondsPerDay;
    if (unit == "year" || unit == "yr") return kDaysPerJulianYear;
    if (unit == "century") return kDaysPerJulianCentury;
    throw SystemLoadError("unknown time unit '" + unit + "'");
}

double SystemLoader::radiansPerAngleUnit(const std::string& unit) {
    if (unit == "deg") return kDegToRad;
    if (unit == "rad") return 1.0;
    throw SystemLoadError("unknown angle unit '" + unit + "'");
}

LoadedSystem SystemLoader::loadFile(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        PLOGE << "SystemLoader: cannot open " << path;
        throw SystemLoadError("cannot open system file '" + path + "'");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    PLOGI << "SystemLoader: reading " << path;
    return loadString(ss.str());
}

LoadedSystem SystemLoader::loadString(const std::string& text) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        PLOGE << "SystemLoader: parse error: " << e.what();
        throw SystemLoadError(std::string("system file parse error: ") + e.what());
    }
    return loadJSON(j);
}

LoadedSystem SystemLoader::loadJSON(const nlohmann::json& j) const {
    if (!j.is_object()) throw SystemLoadError("system file: top level must be an object");
    if (!j.contains("bodies") || !j["bodies"].is_array())
        throw SystemLoadError("system file: missing 'bodies' array");

    std::string name;
    SystemUnits units;
    UnitContext ctx;
    double epoch = 0.0;
    std::vector<CelestialBody> bodies;

    try {
        name = j.value("name", "");
        if (j.contains("units")) {
            const auto& u = j["units"];
            units.length = u.value("length", units.length);
            units.angle = u.value("angle", units.angle);
            units.time = u.value("time", units.time);
        }
        ctx.metersPerLength = metersPerLengthUnit(units.length);
        ctx.daysPerTime = daysPerTimeUnit(units.time);
        ctx.radiansPerAngle = radiansPerAngleUnit(units.angle);

        epoch = optionalNumber(j, "epoch", Quantity::Time, ctx, "system file", kJ2000 / ctx.daysPerTime);

        for (const auto& b : j["bodies"])
            bodies.push_back(parseBody(b, ctx, epoch));
    } catch (const nlohmann::json::exception& e) {
        PLOGE << "SystemLoader: malformed system file: " << e.what();
        throw SystemLoadError(std::string("malformed system file: ") + e.what());
    }

    // ── Element validation per policy ────────────────────────────────
    std::unordered_set<std::string> dropped;
    for (const auto& b : bodies) {
        if (b.isRoot() || !b.elements) continue;
        try {
            validateElements(*b.elements, b.id);
        } catch (const InvalidElements& e) {
            if (m_policy == InvalidBodyPolicy::Abort) {
                PLOGE << "SystemLoader: aborting on invalid body: " << e.what();
                throw;
            }
            PLOGW << "SystemLoader: skipping body '" << b.id << "': " << e.what();
            dropped.insert(b.id);
        }
    }

    // Descendants of a dropped body go with it
    bool grew = !dropped.empty();
    while (grew) {
        grew = false;
        for (const auto& b : bodies) {
            if (b.parentId && dropped.count(*b.parentId) && !dropped.count(b.id)) {
                PLOGW << "SystemLoader: skipping body '" << b.id << "' (parent '" << *b.parentId << "' was skipped)";
                dropped.insert(b.id);
                grew = true;
            }
        }
    }

    std::vector<std::string> skipped;
    std::vector<CelestialBody> kept;
    kept.reserve(bodies.size());
    for (auto& b : bodies) {
        if (dropped.count(b.id)) skipped.push_back(b.id);
        else kept.push_back(std::move(b));
    }

    PLOGI << "SystemLoader: system '" << name << "' with " << kept.size() << " bodies ("
          << skipped.size() << " skipped)";

    return LoadedSystem{name, units, epoch, BodyGraph(std::move(kept), m_solver), std::move(skipped)};
}

} // namespace Orrery
