#pragma once

#include <cmath>

namespace nebula {

struct Vec2 {
    float x = 0, y = 0;
};

struct Rotation3 {
    float x = 0, y = 0, z = 0;  // radians
};

// ============================================================
// InteractionSample — one raw gesture reading (unsmoothed)
// ============================================================
struct InteractionSample {
    float scale = 1.0f;
    Vec2 offset;
    Rotation3 rotation;

    static InteractionSample neutral() { return {}; }

    bool isNeutral() const
    {
        return scale == 1.0f && offset.x == 0.0f && offset.y == 0.0f
            && rotation.x == 0.0f && rotation.y == 0.0f && rotation.z == 0.0f;
    }
};

// ============================================================
// SmoothedInteractionState — filtered values, mutated every tick.
// The morph buffer lives in ParticleField::current().
// ============================================================
struct SmoothedInteractionState {
    float scale = 1.0f;
    Vec2 offset;
    Rotation3 rotation;
};

} // namespace nebula
