#include "MotionSmoother.h"
#include <cmath>

namespace nebula {

static inline void ease(float& v, float target, float alpha)
{
    v += (target - v) * alpha;
}

float MotionSmoother::effectiveAlpha(float alpha, float dt) const
{
    if (!params_.frameRateIndependent)
        return alpha;
    if (!(dt > 0.0f) || !std::isfinite(dt) || !(params_.referenceDt > 0.0f))
        return alpha;
    if (alpha <= 0.0f) return 0.0f;
    if (alpha >= 1.0f) return 1.0f;

    // k = -ln(1 - alpha) / dtRef ; alpha' = 1 - exp(-k dt)
    float k = -std::log(1.0f - alpha) / params_.referenceDt;
    return 1.0f - std::exp(-k * dt);
}

void MotionSmoother::advanceMorph(ParticleField& field, float dt) const
{
    float a = effectiveAlpha(params_.morphAlpha, dt);
    auto& cur = field.current();
    auto& tgt = field.target();
    for (size_t i = 0; i < cur.size(); ++i) {
        ease(cur[i].x, tgt[i].x, a);
        ease(cur[i].y, tgt[i].y, a);
        ease(cur[i].z, tgt[i].z, a);
    }
}

void MotionSmoother::advanceInteraction(SmoothedInteractionState& state,
                                        const InteractionSample& target, float dt) const
{
    float aScale = effectiveAlpha(params_.scaleAlpha, dt);
    float aOffset = effectiveAlpha(params_.offsetAlpha, dt);
    float aRot = effectiveAlpha(params_.rotationAlpha, dt);

    ease(state.scale, target.scale, aScale);

    ease(state.offset.x, target.offset.x, aOffset);
    ease(state.offset.y, target.offset.y, aOffset);

    ease(state.rotation.x, target.rotation.x, aRot);
    ease(state.rotation.y, target.rotation.y, aRot);
    ease(state.rotation.z, target.rotation.z, aRot);
}

void MotionSmoother::advance(SmoothedInteractionState& state, ParticleField& field,
                             const InteractionSample& target, float dt) const
{
    advanceMorph(field, dt);
    advanceInteraction(state, target, dt);
}

} // namespace nebula
