#pragma once
#include <Orrery/BodyGraph.hpp>
#include <Orrery/EngineConfig.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Orrery {

// Default units of a system file. Lengths and times found in the file are
// converted to these; angles always end up in radians.
struct SystemUnits {
    std::string length = "AU";  // AU, km, m
    std::string angle = "deg";  // deg, rad
    std::string time = "day";   // day, hour, minute, second, year, century
};

struct LoadedSystem {
    std::string name;
    SystemUnits units;
    double epoch = 0.0;                 // file-level epoch, system time unit
    BodyGraph graph;
    std::vector<std::string> skipped;   // ids dropped under InvalidBodyPolicy::Skip
};

/**
 * @brief Builds a BodyGraph from a JSON system description
 *
 * {
 *   "name": "Sol",
 *   "units": { "length": "AU", "angle": "deg", "time": "day" },
 *   "epoch": 2451545.0,
 *   "bodies": [
 *     { "id": "sun", "type": "Star" },
 *     { "id": "earth", "parent": "sun", "jpl": "earth" },
 *     { "id": "moon", "parent": "earth", "type": "Moon",
 *       "orbit": { "semiMajorAxis": { "value": 384400, "unit": "km" }, ... } }
 *   ]
 * }
 *
 * Any numeric field may be { "value": x, "unit": "u" } to override the
 * system unit. "jpl": "<planet>" takes the elements from EphemerisCatalog.
 * A per-orbit "epoch" overrides the file epoch; a negative period means
 * retrograde motion.
 *
 * Syntax errors, missing required fields and unknown units raise
 * SystemLoadError. Bodies whose elements fail validation are dropped with
 * their descendants (InvalidBodyPolicy::Skip) or rethrown as
 * InvalidElements (InvalidBodyPolicy::Abort). Topology errors from
 * BodyGraph propagate unchanged.
 */
class SystemLoader {
public:
    explicit SystemLoader(InvalidBodyPolicy policy = InvalidBodyPolicy::Skip,
                          const KeplerSolver& solver = KeplerSolver());
    explicit SystemLoader(const EngineConfig& config);

    LoadedSystem loadFile(const std::string& path) const;
    LoadedSystem loadString(const std::string& text) const;
    LoadedSystem loadJSON(const nlohmann::json& j) const;

    InvalidBodyPolicy policy() const { return m_policy; }

    // ── Unit conversion ──────────────────────────────────────────────
    // Throw SystemLoadError for unit names they do not know.
    static double metersPerLengthUnit(const std::string& unit);
    static double daysPerTimeUnit(const std::string& unit);
    static double radiansPerAngleUnit(const std::string& unit);

private:
    InvalidBodyPolicy m_policy;
    KeplerSolver m_solver;
};

} // namespace Orrery
