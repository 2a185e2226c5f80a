#include <Orrery/KeplerSolver.hpp>
#include <Orrery/OrbitalElements.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <plog/Log.h>
#include <cmath>
#include <stdexcept>

namespace Orrery {

KeplerSolver::KeplerSolver(double tolerance, int maxIterations)
    : m_tolerance(tolerance), m_maxIterations(maxIterations) {
    if (!(tolerance > 0.0) || !std::isfinite(tolerance))
        throw std::invalid_argument("KeplerSolver: tolerance must be positive");
    if (maxIterations < 1)
        throw std::invalid_argument("KeplerSolver: maxIterations must be at least 1");
}

double KeplerSolver::solve(double meanAnomaly, double eccentricity) const {
    return solveDetailed(meanAnomaly, eccentricity).eccentricAnomaly;
}

KeplerSolution KeplerSolver::solveDetailed(double meanAnomaly, double eccentricity) const {
    KeplerSolution result;
    const double M = normalizeAngle(meanAnomaly);
    const double e = eccentricity;
    result.meanAnomaly = M;

    double E = (e < kHighEccentricity) ? M : kPi;

    for (int i = 0; i < m_maxIterations; ++i) {
        double dE = (E - e * std::sin(E) - M) / (1.0 - e * std::cos(E));
        E -= dE;
        if (std::fabs(dE) < m_tolerance) {
            result.eccentricAnomaly = E;
            result.iterations = i + 1;
            result.residual = std::fabs(E - e * std::sin(E) - M);
            return result;
        }
    }

    PLOGE << "KeplerSolver: no convergence after " << m_maxIterations
          << " iterations (M=" << M << ", e=" << e << ")";
    throw NonConvergence(M, e, m_maxIterations);
}

} // namespace Orrery
