#pragma once
#include <Orrery/OrbitalElements.hpp>
#include <optional>
#include <string>

namespace Orrery {

enum class BodyType {
    Star,
    Planet,
    DwarfPlanet,
    Moon,
    AsteroidBelt,
    Comet,
    Station
};

inline const char* bodyTypeName(BodyType t) {
    switch (t) {
        case BodyType::Star:         return "Star";
        case BodyType::Planet:       return "Planet";
        case BodyType::DwarfPlanet:  return "DwarfPlanet";
        case BodyType::Moon:         return "Moon";
        case BodyType::AsteroidBelt: return "AsteroidBelt";
        case BodyType::Comet:        return "Comet";
        case BodyType::Station:      return "Station";
    }
    return "Unknown";
}

// Inverse of bodyTypeName; empty for names it does not know.
inline std::optional<BodyType> parseBodyType(const std::string& s) {
    if (s == "Star")         return BodyType::Star;
    if (s == "Planet")       return BodyType::Planet;
    if (s == "DwarfPlanet")  return BodyType::DwarfPlanet;
    if (s == "Moon")         return BodyType::Moon;
    if (s == "AsteroidBelt") return BodyType::AsteroidBelt;
    if (s == "Comet")        return BodyType::Comet;
    if (s == "Station")      return BodyType::Station;
    return std::nullopt;
}

// ── Celestial body definition ────────────────────────────────────────
// A node of the BodyGraph. The body never stores its position; positions
// are derived per query from the elements and the parent chain.
struct CelestialBody {
    std::string id;                       // stable identity key, unique in a graph
    std::optional<std::string> parentId;  // empty = root (sits at the origin)

    std::string name;
    BodyType bodyType = BodyType::Planet;

    // Orbit around the parent (required for non-roots, ignored for roots)
    std::optional<OrbitalElements> elements;

    // Physical payload for the renderer, passed through untouched
    double radius = 1.0;
    double rotationPeriod = 1.0;
    double axialTilt = 0.0;     // radians
    std::string bodyJSON;       // extended metadata (atmosphere, rings, colors)

    bool isRoot() const { return !parentId.has_value(); }
};

} // namespace Orrery
