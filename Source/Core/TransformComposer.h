#pragma once

#include "../Model/Interaction.h"
#include "../Model/ParticleField.h"
#include "../Model/Point3.h"

namespace nebula {

// ============================================================
// TransformComposer — per-particle output transform:
//   1. idle breathing (suppressed while the user scales)
//   2. rotation (gesture rotation + slow auto-spin about Y)
//   3. isotropic scale
//   4. planar translation (x, y only)
// ============================================================
namespace TransformComposer {

    inline constexpr float BreathingRate      = 2.0f;   // rad/s of the sine
    inline constexpr float BreathingDepth     = 0.05f;
    inline constexpr float InteractionDeadband = 0.05f;
    inline constexpr float AutoSpinRate       = 0.05f;  // rad/s about Y

    // Everything that is constant across particles for one tick
    struct FrameTransform {
        float m[3][3] = {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}};
        float scale = 1.0f;
        Vec2 offset;
    };

    float breathing(float elapsed);
    bool isInteracting(float smoothedScale);
    float finalScale(float smoothedScale, float elapsed);

    // Euler XYZ rotation matrix (Rx * Ry * Rz)
    void rotationMatrix(const Rotation3& r, float out[3][3]);

    FrameTransform frameTransform(const SmoothedInteractionState& state, float elapsed);

    Point3 apply(const FrameTransform& ft, const Point3& p);

    Point3 compose(const Point3& base, const SmoothedInteractionState& state, float elapsed);

    // Map every current-morph point into the base buffer
    void composeAll(ParticleField& field, const SmoothedInteractionState& state, float elapsed);

} // namespace TransformComposer
} // namespace nebula
