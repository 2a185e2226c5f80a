#pragma once

namespace Orrery {

/**
 * @brief Result of one Kepler solve
 */
struct KeplerSolution {
    double eccentricAnomaly = 0.0;  // E, radians
    double meanAnomaly = 0.0;       // M after normalization to [0, 2*pi)
    int iterations = 0;
    double residual = 0.0;          // |E - e*sin(E) - M|
};

/**
 * @brief Newton-Raphson solver for Kepler's equation M = E - e*sin(E)
 *
 * M is wrapped into [0, 2*pi) before iterating. The iteration starts from
 * E0 = M, or from E0 = pi for e >= 0.8 where the M guess can overshoot
 * out of the region in which Newton converges monotonically. Iteration
 * stops when successive estimates differ by less than the tolerance; if
 * the cap is reached first, NonConvergence is thrown.
 *
 * Stateless apart from its settings, so one instance can be shared
 * between threads.
 */
class KeplerSolver {
public:
    static constexpr double kDefaultTolerance = 1e-8;
    static constexpr int kDefaultMaxIterations = 50;
    static constexpr double kHighEccentricity = 0.8;

    explicit KeplerSolver(double tolerance = kDefaultTolerance, int maxIterations = kDefaultMaxIterations);

    double tolerance() const { return m_tolerance; }
    int maxIterations() const { return m_maxIterations; }

    // Eccentric anomaly E for mean anomaly M (radians) and eccentricity 0 <= e < 1.
    double solve(double meanAnomaly, double eccentricity) const;

    KeplerSolution solveDetailed(double meanAnomaly, double eccentricity) const;

private:
    double m_tolerance;
    int m_maxIterations;
};

} // namespace Orrery
