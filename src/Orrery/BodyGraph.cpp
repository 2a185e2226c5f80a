#include <Orrery/BodyGraph.hpp>
#include <Orrery/OrbitErrors.hpp>
#include <Orrery/OrbitPathSampler.hpp>
#include <plog/Log.h>
#include <algorithm>

namespace Orrery {

BodyGraph::BodyGraph(std::vector<CelestialBody> bodies, const KeplerSolver& solver)
    : m_solver(solver) {
    m_nodes.reserve(bodies.size());
    for (auto& b : bodies) {
        if (m_index.count(b.id)) {
            PLOGE << "BodyGraph: duplicate body id '" << b.id << "'";
            throw DuplicateBody(b.id);
        }
        m_index.emplace(b.id, static_cast<int>(m_nodes.size()));
        Node node;
        node.body = std::move(b);
        m_nodes.push_back(std::move(node));
    }

    buildHierarchy();
    detectCycles();
    buildOrder();
    attachOrbits();

    int maxDepth = 0;
    for (const auto& n : m_nodes) maxDepth = std::max(maxDepth, n.depth);
    PLOGI << "BodyGraph: built with " << m_nodes.size() << " bodies, "
          << roots().size() << " root(s), max depth " << maxDepth;
}

void BodyGraph::buildHierarchy() {
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        Node& node = m_nodes[i];
        if (node.body.isRoot()) continue;

        auto it = m_index.find(*node.body.parentId);
        if (it == m_index.end()) {
            PLOGE << "BodyGraph::buildHierarchy - parent not found for body '" << node.body.id
                  << "' (parentId=" << *node.body.parentId << ")";
            throw UnknownParent(node.body.id, *node.body.parentId);
        }
        node.parent = it->second;
        m_nodes[it->second].children.push_back(static_cast<int>(i));
    }
}

void BodyGraph::detectCycles() const {
    // 0 = unvisited, 1 = on the current parent walk, 2 = reaches a root
    std::vector<int> state(m_nodes.size(), 0);
    std::vector<int> walk;

    for (size_t start = 0; start < m_nodes.size(); ++start) {
        walk.clear();
        int cur = static_cast<int>(start);
        while (cur >= 0 && state[cur] == 0) {
            state[cur] = 1;
            walk.push_back(cur);
            cur = m_nodes[cur].parent;
        }
        if (cur >= 0 && state[cur] == 1) {
            PLOGE << "BodyGraph: parent cycle through body '" << m_nodes[cur].body.id << "'";
            throw CycleDetected(m_nodes[cur].body.id);
        }
        for (int idx : walk) state[idx] = 2;
    }
}

void BodyGraph::buildOrder() {
    m_order.clear();
    m_order.reserve(m_nodes.size());
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        if (m_nodes[i].parent < 0) m_order.push_back(static_cast<int>(i));
    }
    // Breadth-first from the roots; m_order doubles as the queue
    for (size_t head = 0; head < m_order.size(); ++head) {
        const Node& node = m_nodes[m_order[head]];
        for (int child : node.children) {
            m_nodes[child].depth = node.depth + 1;
            m_order.push_back(child);
        }
    }

    m_orderIds.clear();
    m_orderIds.reserve(m_order.size());
    for (int idx : m_order) m_orderIds.push_back(m_nodes[idx].body.id);
}

void BodyGraph::attachOrbits() {
    for (auto& node : m_nodes) {
        if (node.parent < 0) continue;
        if (!node.body.elements) {
            PLOGE << "BodyGraph: body '" << node.body.id << "' has a parent but no orbital elements";
            throw InvalidElements("elements", "non-root body has no orbital elements", node.body.id);
        }
        node.orbit.emplace(*node.body.elements, m_solver, node.body.id);
    }
}

int BodyGraph::indexOf(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) throw UnknownBody(id);
    return it->second;
}

bool BodyGraph::contains(const std::string& id) const {
    return m_index.count(id) != 0;
}

const CelestialBody& BodyGraph::body(const std::string& id) const {
    return m_nodes[indexOf(id)].body;
}

const CelestialBody* BodyGraph::findBody(const std::string& id) const {
    auto it = m_index.find(id);
    return (it == m_index.end()) ? nullptr : &m_nodes[it->second].body;
}

const CelestialBody* BodyGraph::parent(const std::string& id) const {
    const Node& node = m_nodes[indexOf(id)];
    return (node.parent < 0) ? nullptr : &m_nodes[node.parent].body;
}

std::vector<const CelestialBody*> BodyGraph::children(const std::string& id) const {
    const Node& node = m_nodes[indexOf(id)];
    std::vector<const CelestialBody*> out;
    out.reserve(node.children.size());
    for (int c : node.children) out.push_back(&m_nodes[c].body);
    return out;
}

std::vector<const CelestialBody*> BodyGraph::roots() const {
    std::vector<const CelestialBody*> out;
    for (const auto& n : m_nodes) {
        if (n.parent < 0) out.push_back(&n.body);
    }
    return out;
}

int BodyGraph::depth(const std::string& id) const {
    return m_nodes[indexOf(id)].depth;
}

Vec3 BodyGraph::localOffset(int index, double simulationTime) const {
    const Node& node = m_nodes[index];
    if (!node.orbit) return Vec3(0.0);
    return node.orbit->position(simulationTime);
}

Vec3 BodyGraph::localPosition(const std::string& id, double simulationTime) const {
    return localOffset(indexOf(id), simulationTime);
}

Vec3 BodyGraph::absolutePosition(const std::string& id, double simulationTime) const {
    std::vector<int> chain;
    for (int cur = indexOf(id); cur >= 0; cur = m_nodes[cur].parent)
        chain.push_back(cur);

    // Accumulate from the root down so the sum associates exactly like the
    // batch query does.
    Vec3 pos(0.0);
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (m_nodes[*it].parent < 0) continue;
        pos = pos + localOffset(*it, simulationTime);
    }
    return pos;
}

BodyGraph::PositionMap BodyGraph::absolutePositions(double simulationTime) const {
    std::vector<Vec3> absolute(m_nodes.size(), Vec3(0.0));
    for (int idx : m_order) {
        const Node& node = m_nodes[idx];
        if (node.parent < 0) continue;
        absolute[idx] = absolute[node.parent] + localOffset(idx, simulationTime);
    }

    PositionMap result;
    result.reserve(m_nodes.size());
    for (size_t i = 0; i < m_nodes.size(); ++i)
        result.emplace(m_nodes[i].body.id, absolute[i]);
    return result;
}

std::vector<Vec3> BodyGraph::orbitPath(const std::string& id, int segments) const {
    const Node& node = m_nodes[indexOf(id)];
    if (!node.orbit) return {};
    return OrbitPathSampler::samplePath(node.orbit->elements(), segments);
}

std::vector<Vec3> BodyGraph::absoluteOrbitPath(const std::string& id, double simulationTime, int segments) const {
    const Node& node = m_nodes[indexOf(id)];
    if (!node.orbit) return {};

    std::vector<Vec3> path = OrbitPathSampler::samplePathAt(node.orbit->elements(), simulationTime, segments);
    const Vec3 origin = absolutePosition(m_nodes[node.parent].body.id, simulationTime);
    for (auto& p : path) p += origin;
    return path;
}

} // namespace Orrery
