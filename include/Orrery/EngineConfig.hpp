#pragma once
#include <Orrery/KeplerSolver.hpp>
#include <nlohmann/json.hpp>
#include <plog/Severity.h>
#include <string>

namespace Orrery {

// What the loader does with a body whose elements fail validation.
enum class InvalidBodyPolicy {
    Skip,   // drop the body and its descendants, log a warning
    Abort   // rethrow InvalidElements
};

const char* invalidBodyPolicyName(InvalidBodyPolicy policy);

/**
 * @brief Engine settings read from a JSON file
 *
 * {
 *   "solver":  { "tolerance": 1e-8, "maxIterations": 50 },
 *   "path":    { "segments": 128 },
 *   "loader":  { "invalidBodyPolicy": "skip" },
 *   "logging": { "level": "info" }
 * }
 *
 * Missing keys keep their defaults. Values of the wrong type or out of
 * range raise SystemLoadError.
 */
struct EngineConfig {
    double solverTolerance = KeplerSolver::kDefaultTolerance;
    int solverMaxIterations = KeplerSolver::kDefaultMaxIterations;
    int pathSegments = 128;
    InvalidBodyPolicy invalidBodyPolicy = InvalidBodyPolicy::Skip;
    plog::Severity logLevel = plog::info;

    KeplerSolver makeSolver() const;

    nlohmann::json toJSON() const;
    static EngineConfig fromJSON(const nlohmann::json& j);

    static EngineConfig load(const std::string& path);
};

} // namespace Orrery
