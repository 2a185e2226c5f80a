#pragma once
#include <stdexcept>
#include <string>

namespace Orrery {

// ── Error hierarchy ──────────────────────────────────────────────────
// Everything the engine raises derives from OrbitError so that a loader
// or UI can catch engine failures in one place.
class OrbitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An OrbitalElements record violates an invariant
 *
 * Raised once when elements are validated (calculator or graph
 * construction), or at query time when secular drift pushes a shape
 * element out of range.
 */
class InvalidElements : public OrbitError {
public:
    InvalidElements(const std::string& field, const std::string& message, const std::string& bodyId = "")
        : OrbitError(bodyId.empty() ? message : "body '" + bodyId + "': " + message),
          m_field(field), m_bodyId(bodyId) {}

    const std::string& field() const { return m_field; }
    const std::string& bodyId() const { return m_bodyId; }

private:
    std::string m_field;
    std::string m_bodyId;
};

/**
 * @brief Kepler's equation did not converge within the iteration cap
 */
class NonConvergence : public OrbitError {
public:
    NonConvergence(double meanAnomaly, double eccentricity, int iterations)
        : OrbitError("Kepler solver did not converge after " + std::to_string(iterations) +
                     " iterations (M=" + std::to_string(meanAnomaly) +
                     ", e=" + std::to_string(eccentricity) + ")"),
          m_meanAnomaly(meanAnomaly), m_eccentricity(eccentricity), m_iterations(iterations) {}

    double meanAnomaly() const { return m_meanAnomaly; }
    double eccentricity() const { return m_eccentricity; }
    int iterations() const { return m_iterations; }

private:
    double m_meanAnomaly;
    double m_eccentricity;
    int m_iterations;
};

// Graph construction / lookup failures carry the id of the offending body.
class BodyGraphError : public OrbitError {
public:
    BodyGraphError(const std::string& bodyId, const std::string& message)
        : OrbitError(message), m_bodyId(bodyId) {}

    const std::string& bodyId() const { return m_bodyId; }

private:
    std::string m_bodyId;
};

class CycleDetected : public BodyGraphError {
public:
    explicit CycleDetected(const std::string& bodyId)
        : BodyGraphError(bodyId, "parent cycle detected at body '" + bodyId + "'") {}
};

class UnknownParent : public BodyGraphError {
public:
    UnknownParent(const std::string& bodyId, const std::string& parentId)
        : BodyGraphError(bodyId, "body '" + bodyId + "' references unknown parent '" + parentId + "'"),
          m_parentId(parentId) {}

    const std::string& parentId() const { return m_parentId; }

private:
    std::string m_parentId;
};

class DuplicateBody : public BodyGraphError {
public:
    explicit DuplicateBody(const std::string& bodyId)
        : BodyGraphError(bodyId, "duplicate body id '" + bodyId + "'") {}
};

class UnknownBody : public BodyGraphError {
public:
    explicit UnknownBody(const std::string& bodyId)
        : BodyGraphError(bodyId, "no body with id '" + bodyId + "'") {}
};

// Malformed system description or configuration file.
class SystemLoadError : public OrbitError {
public:
    using OrbitError::OrbitError;
};

} // namespace Orrery
