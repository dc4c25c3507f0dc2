#pragma once

#include "../Model/ParticleField.h"
#include "../Model/SculptureConfig.h"
#include "../Model/Interaction.h"
#include "InteractionCell.h"
#include "MotionSmoother.h"
#include <random>

namespace nebula {

// ============================================================
// SculptureEngine — owns the particle field and everything that
// advances it. The landmark thread only touches the interaction
// cell; all other members belong to the animation tick.
// ============================================================
class SculptureEngine {
public:
    explicit SculptureEngine(const SculptureConfig& config,
                             uint32_t seed = std::random_device{}());

    // Replace the morph target with a freshly generated shape.
    // No-op when the shape is already active.
    void setShape(ShapeKind shape);
    ShapeKind getShape() const { return shape_; }

    // One animation step: read latest sample, ease, recompose
    void tick(float elapsedSeconds, float dtSeconds);

    InteractionCell& getInteractionCell() { return cell_; }
    void resetInteraction() { cell_.reset(); }

    const ParticleField& getField() const { return field_; }
    const SmoothedInteractionState& getState() const { return state_; }

    int getParticleCount() const { return field_.size(); }
    const float* getPositions() const { return field_.flatPositions(); }

private:
    ShapeKind shape_;
    std::mt19937 rng_;
    ParticleField field_;
    SmoothedInteractionState state_;
    MotionSmoother smoother_;
    InteractionCell cell_;

    JUCE_DECLARE_NON_COPYABLE(SculptureEngine)
};

} // namespace nebula
