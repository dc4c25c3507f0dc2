#include "SculptureEngine.h"
#include "ShapeGenerator.h"
#include "TransformComposer.h"

namespace nebula {

static SmoothingParams smoothingFor(const SculptureConfig& config)
{
    SmoothingParams p;
    p.referenceDt = 1.0f / 60.0f;
    p.frameRateIndependent = config.frameRateIndependent;
    return p;
}

SculptureEngine::SculptureEngine(const SculptureConfig& config, uint32_t seed)
    : shape_(config.shape),
      rng_(seed),
      field_(config.particleCount),
      smoother_(smoothingFor(config))
{
    auto initial = ShapeGenerator::generate(shape_, field_.size(), rng_);
    field_.resetTo(initial);
    DBG("[engine] Created " + juce::String(field_.size()) + " particles as "
        + juce::String(shapeToString(shape_)));
}

void SculptureEngine::setShape(ShapeKind shape)
{
    if (shape == shape_) return;
    shape_ = shape;
    ShapeGenerator::generateInto(shape_, rng_, field_.target());
    DBG("[engine] Morphing to " + juce::String(shapeToString(shape_)));
}

void SculptureEngine::tick(float elapsedSeconds, float dtSeconds)
{
    auto target = cell_.read();
    smoother_.advance(state_, field_, target, dtSeconds);
    TransformComposer::composeAll(field_, state_, elapsedSeconds);
}

} // namespace nebula
