#include "TransformComposer.h"
#include <algorithm>
#include <cmath>

namespace nebula {
namespace TransformComposer {

float breathing(float elapsed)
{
    return std::sin(elapsed * BreathingRate) * BreathingDepth + 1.0f;
}

bool isInteracting(float smoothedScale)
{
    return std::abs(smoothedScale - 1.0f) > InteractionDeadband;
}

float finalScale(float smoothedScale, float elapsed)
{
    return isInteracting(smoothedScale) ? smoothedScale
                                        : smoothedScale * breathing(elapsed);
}

void rotationMatrix(const Rotation3& r, float out[3][3])
{
    float a = std::cos(r.x), b = std::sin(r.x);
    float c = std::cos(r.y), d = std::sin(r.y);
    float e = std::cos(r.z), f = std::sin(r.z);

    float ae = a * e, af = a * f, be = b * e, bf = b * f;

    out[0][0] = c * e;
    out[0][1] = -c * f;
    out[0][2] = d;

    out[1][0] = af + be * d;
    out[1][1] = ae - bf * d;
    out[1][2] = -b * c;

    out[2][0] = bf - ae * d;
    out[2][1] = be + af * d;
    out[2][2] = a * c;
}

FrameTransform frameTransform(const SmoothedInteractionState& state, float elapsed)
{
    FrameTransform ft;
    Rotation3 r = state.rotation;
    r.y += elapsed * AutoSpinRate;
    rotationMatrix(r, ft.m);
    ft.scale = finalScale(state.scale, elapsed);
    ft.offset = state.offset;
    return ft;
}

// Rotate, then scale, then translate; the offset is never rotated or scaled
Point3 apply(const FrameTransform& ft, const Point3& p)
{
    float rx = ft.m[0][0] * p.x + ft.m[0][1] * p.y + ft.m[0][2] * p.z;
    float ry = ft.m[1][0] * p.x + ft.m[1][1] * p.y + ft.m[1][2] * p.z;
    float rz = ft.m[2][0] * p.x + ft.m[2][1] * p.y + ft.m[2][2] * p.z;
    return {
        rx * ft.scale + ft.offset.x,
        ry * ft.scale + ft.offset.y,
        rz * ft.scale
    };
}

Point3 compose(const Point3& base, const SmoothedInteractionState& state, float elapsed)
{
    return apply(frameTransform(state, elapsed), base);
}

void composeAll(ParticleField& field, const SmoothedInteractionState& state, float elapsed)
{
    auto ft = frameTransform(state, elapsed);
    std::transform(field.current().begin(), field.current().end(), field.base().begin(),
                   [&ft](const Point3& p) { return apply(ft, p); });
}

} // namespace TransformComposer
} // namespace nebula
