#pragma once

#include "../Model/Interaction.h"
#include "../Model/ParticleField.h"

namespace nebula {

// ============================================================
// SmoothingParams — per-tick easing fractions.
// With frameRateIndependent set, each alpha is treated as the
// fraction covered in one referenceDt and rescaled to the real dt.
// ============================================================
struct SmoothingParams {
    float morphAlpha    = 0.15f;
    float scaleAlpha    = 0.15f;
    float offsetAlpha   = 0.1f;
    float rotationAlpha = 0.1f;
    float referenceDt   = 1.0f / 60.0f;
    bool frameRateIndependent = false;
};

// ============================================================
// MotionSmoother — first-order exponential filters
//   v += (target - v) * alpha
// applied once per tick to the morph buffer and to
// scale / offset / rotation.
// ============================================================
class MotionSmoother {
public:
    MotionSmoother() = default;
    explicit MotionSmoother(const SmoothingParams& p) : params_(p) {}

    // Advance `state` and field.current() toward their targets in place
    void advance(SmoothedInteractionState& state, ParticleField& field,
                 const InteractionSample& target, float dt) const;

    void advanceMorph(ParticleField& field, float dt) const;
    void advanceInteraction(SmoothedInteractionState& state,
                            const InteractionSample& target, float dt) const;

    // Fraction applied this tick for a nominal per-tick alpha
    float effectiveAlpha(float alpha, float dt) const;

private:
    SmoothingParams params_;
};

} // namespace nebula
