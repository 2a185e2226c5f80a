#pragma once
#include <Orrery/CelestialBody.hpp>
#include <Orrery/OrbitalMechanics.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Orrery {

/**
 * @brief Forest of bodies composing local orbits into absolute positions
 *
 * Roots (bodies without a parent) sit at the origin. Every other body's
 * absolute position is its parent's absolute position plus its own orbital
 * offset, to any depth (star -> planet -> moon -> sub-moon).
 *
 * Topology is fixed at construction, which checks, in order: duplicate ids
 * (DuplicateBody), unresolved parents (UnknownParent), parent cycles
 * (CycleDetected) and the orbital elements of every non-root
 * (InvalidElements). Positions are never cached between queries, so a
 * const BodyGraph can be queried from several threads at once.
 */
class BodyGraph {
public:
    using PositionMap = std::unordered_map<std::string, Vec3>;

    explicit BodyGraph(std::vector<CelestialBody> bodies, const KeplerSolver& solver = KeplerSolver());
    ~BodyGraph() = default;
    BodyGraph(BodyGraph&&) = default;
    BodyGraph& operator=(BodyGraph&&) = default;
    BodyGraph(const BodyGraph&) = delete;
    BodyGraph& operator=(const BodyGraph&) = delete;

    // Accessors
    size_t size() const { return m_nodes.size(); }
    bool contains(const std::string& id) const;
    const CelestialBody& body(const std::string& id) const;
    const CelestialBody* findBody(const std::string& id) const;
    const CelestialBody* parent(const std::string& id) const;
    std::vector<const CelestialBody*> children(const std::string& id) const;
    std::vector<const CelestialBody*> roots() const;
    int depth(const std::string& id) const;

    // Body ids, every parent before its children.
    const std::vector<std::string>& topologicalOrder() const { return m_orderIds; }

    // Offset from the parent (origin for roots).
    Vec3 localPosition(const std::string& id, double simulationTime) const;

    Vec3 absolutePosition(const std::string& id, double simulationTime) const;

    // Every body at one instant; shared ancestors are computed once per call.
    PositionMap absolutePositions(double simulationTime) const;

    // Orbit shape in the parent frame (empty for roots).
    std::vector<Vec3> orbitPath(const std::string& id, int segments) const;

    // Orbit shape translated to the parent's absolute position at `simulationTime`.
    std::vector<Vec3> absoluteOrbitPath(const std::string& id, double simulationTime, int segments) const;

private:
    struct Node {
        CelestialBody body;
        int parent = -1;
        std::vector<int> children;
        int depth = 0;
        std::optional<OrbitalPositionCalculator> orbit;
    };

    std::vector<Node> m_nodes;                    // input order
    std::unordered_map<std::string, int> m_index; // id -> m_nodes index
    std::vector<int> m_order;                     // parents first
    std::vector<std::string> m_orderIds;
    KeplerSolver m_solver;

    int indexOf(const std::string& id) const;
    Vec3 localOffset(int index, double simulationTime) const;

    void buildHierarchy();
    void detectCycles() const;
    void buildOrder();
    void attachOrbits();
};

} // namespace Orrery
