#pragma once

#include "ShapeKind.h"
#include <juce_core/juce_core.h>
#include <string>

namespace nebula {

// ============================================================
// SculptureConfig — persisted application settings.
// Colour, point size and opacity are presentation values the
// engine passes through to the renderer untouched.
// ============================================================
struct SculptureConfig {
    ShapeKind shape = ShapeKind::Galaxy;
    std::string colour = "ff4ecdc4";   // ARGB hex
    int particleCount = 4000;
    float pointSize = 0.08f;
    float opacity = 0.8f;
    int refreshHz = 60;
    int oscPort = 9100;
    bool frameRateIndependent = false;
    int trackingTimeoutMs = 500;

    static constexpr int MinParticles = 1;
    static constexpr int MaxParticles = 200000;

    juce::var toVar() const;

    // Missing or wrong-typed keys keep their defaults; numeric values are clamped
    void fromVar(const juce::var& v);

    bool save(const juce::File& file) const;
    bool load(const juce::File& file);

    static juce::File getDefaultFile();
};

} // namespace nebula
