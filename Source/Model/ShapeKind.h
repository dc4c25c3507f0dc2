#pragma once

#include <string>

namespace nebula {

// ============================================================
// Sculpture shapes selectable from configuration
// ============================================================
enum class ShapeKind { Galaxy, Heart, Flower, Saturn, Fireworks };

inline constexpr int NumShapeKinds = 5;

inline bool shapeFromString(const std::string& s, ShapeKind& out)
{
    if (s == "galaxy")    { out = ShapeKind::Galaxy;    return true; }
    if (s == "heart")     { out = ShapeKind::Heart;     return true; }
    if (s == "flower")    { out = ShapeKind::Flower;    return true; }
    if (s == "saturn")    { out = ShapeKind::Saturn;    return true; }
    if (s == "fireworks") { out = ShapeKind::Fireworks; return true; }
    return false;
}

// Unknown names fall back to Galaxy
inline ShapeKind shapeFromString(const std::string& s)
{
    ShapeKind k = ShapeKind::Galaxy;
    shapeFromString(s, k);
    return k;
}

inline std::string shapeToString(ShapeKind k)
{
    switch (k) {
        case ShapeKind::Galaxy:    return "galaxy";
        case ShapeKind::Heart:     return "heart";
        case ShapeKind::Flower:    return "flower";
        case ShapeKind::Saturn:    return "saturn";
        case ShapeKind::Fireworks: return "fireworks";
    }
    return "galaxy";
}

// Display name for the shape selector
inline std::string shapeDisplayName(ShapeKind k)
{
    switch (k) {
        case ShapeKind::Galaxy:    return "Galaxy";
        case ShapeKind::Heart:     return "Heart";
        case ShapeKind::Flower:    return "Flower";
        case ShapeKind::Saturn:    return "Saturn";
        case ShapeKind::Fireworks: return "Fireworks";
    }
    return "Galaxy";
}

} // namespace nebula
