#include <Orrery/EngineConfig.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <plog/Log.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace Orrery {

namespace {

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key)) return empty;
    const auto& s = j[key];
    if (!s.is_object())
        throw SystemLoadError(std::string("config: '") + key + "' must be an object");
    return s;
}

template <typename T>
T readValue(const nlohmann::json& s, const char* key, T fallback) {
    if (!s.contains(key)) return fallback;
    try {
        return s[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw SystemLoadError(std::string("config: bad value for '") + key + "': " + e.what());
    }
}

plog::Severity severityFromName(const std::string& name) {
    if (name == "none")    return plog::none;
    if (name == "fatal")   return plog::fatal;
    if (name == "error")   return plog::error;
    if (name == "warning") return plog::warning;
    if (name == "info")    return plog::info;
    if (name == "debug")   return plog::debug;
    if (name == "verbose") return plog::verbose;
    throw SystemLoadError("config: unknown logging level '" + name + "'");
}

const char* severityToName(plog::Severity s) {
    switch (s) {
        case plog::none:    return "none";
        case plog::fatal:   return "fatal";
        case plog::error:   return "error";
        case plog::warning: return "warning";
        case plog::info:    return "info";
        case plog::debug:   return "debug";
        case plog::verbose: return "verbose";
    }
    return "info";
}

} // anonymous namespace

const char* invalidBodyPolicyName(InvalidBodyPolicy policy) {
    return policy == InvalidBodyPolicy::Abort ? "abort" : "skip";
}

KeplerSolver EngineConfig::makeSolver() const {
    return KeplerSolver(solverTolerance, solverMaxIterations);
}

nlohmann::json EngineConfig::toJSON() const {
    nlohmann::json j;
    j["solver"]["tolerance"] = solverTolerance;
    j["solver"]["maxIterations"] = solverMaxIterations;
    j["path"]["segments"] = pathSegments;
    j["loader"]["invalidBodyPolicy"] = invalidBodyPolicyName(invalidBodyPolicy);
    j["logging"]["level"] = severityToName(logLevel);
    return j;
}

EngineConfig EngineConfig::fromJSON(const nlohmann::json& j) {
    if (!j.is_object()) throw SystemLoadError("config: top level must be an object");

    EngineConfig cfg;

    const auto& solver = section(j, "solver");
    cfg.solverTolerance = readValue(solver, "tolerance", cfg.solverTolerance);
    cfg.solverMaxIterations = readValue(solver, "maxIterations", cfg.solverMaxIterations);
    if (!std::isfinite(cfg.solverTolerance) || cfg.solverTolerance <= 0.0)
        throw SystemLoadError("config: solver.tolerance must be positive");
    if (cfg.solverMaxIterations < 1)
        throw SystemLoadError("config: solver.maxIterations must be at least 1");

    const auto& path = section(j, "path");
    cfg.pathSegments = readValue(path, "segments", cfg.pathSegments);
    if (cfg.pathSegments < 1)
        throw SystemLoadError("config: path.segments must be at least 1");

    const auto& loader = section(j, "loader");
    std::string policy = readValue<std::string>(loader, "invalidBodyPolicy", invalidBodyPolicyName(cfg.invalidBodyPolicy));
    if (policy == "skip") cfg.invalidBodyPolicy = InvalidBodyPolicy::Skip;
    else if (policy == "abort") cfg.invalidBodyPolicy = InvalidBodyPolicy::Abort;
    else throw SystemLoadError("config: unknown invalidBodyPolicy '" + policy + "'");

    const auto& logging = section(j, "logging");
    cfg.logLevel = severityFromName(readValue<std::string>(logging, "level", severityToName(cfg.logLevel)));

    return cfg;
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        PLOGE << "EngineConfig: cannot open " << path;
        throw SystemLoadError("config: cannot open '" + path + "'");
    }
    std::stringstream ss;
    ss << in.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        PLOGE << "EngineConfig: parse error in " << path << ": " << e.what();
        throw SystemLoadError("config: parse error in '" + path + "': " + e.what());
    }

    EngineConfig cfg = fromJSON(j);
    PLOGI << "EngineConfig: loaded " << path << " (tolerance=" << cfg.solverTolerance
          << ", maxIterations=" << cfg.solverMaxIterations << ", segments=" << cfg.pathSegments << ")";
    return cfg;
}

} // namespace Orrery
