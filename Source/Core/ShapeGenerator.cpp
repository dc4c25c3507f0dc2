#include "ShapeGenerator.h"
#include <algorithm>
#include <cmath>

namespace nebula {
namespace ShapeGenerator {

static constexpr float Pi    = 3.14159265358979f;
static constexpr float TwoPi = 2.0f * Pi;

static float uniform(std::mt19937& rng, float lo, float hi)
{
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(rng);
}

Point3 spherePoint(float r, std::mt19937& rng)
{
    float theta = TwoPi * uniform(rng, 0.0f, 1.0f);
    float phi = std::acos(2.0f * uniform(rng, 0.0f, 1.0f) - 1.0f);
    return {
        r * std::sin(phi) * std::cos(theta),
        r * std::sin(phi) * std::sin(theta),
        r * std::cos(phi)
    };
}

// x = 16 sin^3 t, y = 13cos t - 5cos 2t - 2cos 3t - cos 4t
Point3 heartPoint(std::mt19937& rng)
{
    constexpr float scale = 0.15f;
    float t = uniform(rng, 0.0f, TwoPi);
    float s = std::sin(t);

    Point3 p;
    p.x = 16.0f * s * s * s * scale + uniform(rng, -0.5f, 0.5f);
    p.y = (13.0f * std::cos(t) - 5.0f * std::cos(2.0f * t)
           - 2.0f * std::cos(3.0f * t) - std::cos(4.0f * t)) * scale
          + uniform(rng, -0.5f, 0.5f);
    p.z = uniform(rng, -1.0f, 1.0f);

    // Half the points are pulled inward to fill the interior
    if (uniform(rng, 0.0f, 1.0f) < 0.5f)
        p = p * uniform(rng, 0.0f, 1.0f);
    return p;
}

// Three-turn spiral disk, thicker toward the center
Point3 galaxyPoint(std::mt19937& rng)
{
    constexpr float spiralOffset = 0.5f;
    float angle = uniform(rng, 0.0f, TwoPi * 3.0f);
    float radius = uniform(rng, 0.0f, 5.0f);
    float arm = radius + spiralOffset * angle;

    Point3 p;
    p.x = arm * std::cos(angle) * 0.3f;
    p.z = arm * std::sin(angle) * 0.3f;
    p.y = uniform(rng, -0.5f, 0.5f) * (10.0f - radius) * 0.1f;
    return p;
}

Point3 saturnPoint(std::mt19937& rng)
{
    if (uniform(rng, 0.0f, 1.0f) < PlanetProbability)
        return spherePoint(PlanetRadius, rng);

    float ringRad = uniform(rng, RingInnerRadius, RingOuterRadius);
    float theta = uniform(rng, 0.0f, TwoPi);
    return {
        ringRad * std::cos(theta),
        uniform(rng, -0.05f, 0.05f),
        ringRad * std::sin(theta)
    };
}

// Four-petal rose r = 3cos(4 theta) + 1 with a depth sweep
Point3 flowerPoint(std::mt19937& rng)
{
    float theta = uniform(rng, 0.0f, TwoPi);
    float r = std::cos(4.0f * theta) * 3.0f + 1.0f;
    float phi = uniform(rng, -Pi * 0.25f, Pi * 0.25f);
    return {
        r * std::cos(theta) * std::cos(phi),
        r * std::sin(theta) * std::cos(phi),
        r * std::sin(phi)
    };
}

Point3 fireworksPoint(std::mt19937& rng)
{
    float r = uniform(rng, 0.0f, 1.0f) * FireworksMaxRadius;
    return spherePoint(r, rng);
}

Point3 cubePoint(std::mt19937& rng)
{
    return {
        uniform(rng, -CubeHalfExtent, CubeHalfExtent),
        uniform(rng, -CubeHalfExtent, CubeHalfExtent),
        uniform(rng, -CubeHalfExtent, CubeHalfExtent)
    };
}

static Point3 samplePoint(ShapeKind shape, std::mt19937& rng)
{
    switch (shape) {
        case ShapeKind::Heart:     return heartPoint(rng);
        case ShapeKind::Galaxy:    return galaxyPoint(rng);
        case ShapeKind::Saturn:    return saturnPoint(rng);
        case ShapeKind::Flower:    return flowerPoint(rng);
        case ShapeKind::Fireworks: return fireworksPoint(rng);
        default:                   return cubePoint(rng);
    }
}

void generateInto(ShapeKind shape, std::mt19937& rng, std::vector<Point3>& out)
{
    for (auto& p : out) {
        p = samplePoint(shape, rng);
        // Guard against float edge cases (acos of 1+eps etc.)
        if (!p.isFinite())
            p = {};
    }
}

std::vector<Point3> generate(ShapeKind shape, int count, std::mt19937& rng)
{
    std::vector<Point3> points((size_t)std::max(0, count));
    generateInto(shape, rng, points);
    return points;
}

} // namespace ShapeGenerator
} // namespace nebula
