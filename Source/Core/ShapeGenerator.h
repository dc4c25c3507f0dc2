#pragma once

#include "../Model/Point3.h"
#include "../Model/ShapeKind.h"
#include <cmath>
#include <random>
#include <vector>

namespace nebula {

// ============================================================
// ShapeGenerator — procedural target distributions per shape.
// Every call returns exactly `count` finite points. The random
// engine is supplied by the caller so tests can fix the seed.
// ============================================================
namespace ShapeGenerator {

    inline constexpr float PlanetRadius       = 1.5f;
    inline constexpr float PlanetProbability  = 0.4f;
    inline constexpr float RingInnerRadius    = 2.0f;
    inline constexpr float RingOuterRadius    = 4.5f;
    inline constexpr float FireworksMaxRadius = 4.0f;
    inline constexpr float CubeHalfExtent     = 5.0f;

    std::vector<Point3> generate(ShapeKind shape, int count, std::mt19937& rng);

    // Rewrite an existing buffer in place (size is preserved)
    void generateInto(ShapeKind shape, std::mt19937& rng, std::vector<Point3>& out);

    // Single-point samplers
    Point3 heartPoint(std::mt19937& rng);
    Point3 galaxyPoint(std::mt19937& rng);
    Point3 saturnPoint(std::mt19937& rng);
    Point3 flowerPoint(std::mt19937& rng);
    Point3 fireworksPoint(std::mt19937& rng);
    Point3 cubePoint(std::mt19937& rng);

    // Uniform-area point on a sphere of radius r
    Point3 spherePoint(float r, std::mt19937& rng);

    // True if a Saturn point came from the planet branch
    inline bool isPlanetPoint(const Point3& p)
    {
        return std::abs(p.length() - PlanetRadius) < 1.0e-3f;
    }

} // namespace ShapeGenerator
} // namespace nebula
