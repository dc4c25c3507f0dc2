#pragma once

#include "PointSink.h"
#include <juce_gui_basics/juce_gui_basics.h>

namespace nebula {

// ============================================================
// PointCloudView — draws the composed buffer as perspective-
// projected squares. Colour, size and opacity are pass-through
// presentation values.
// ============================================================
class PointCloudView : public juce::Component,
                       public PointSink {
public:
    PointCloudView();

    void setColour(juce::Colour c) { colour_ = c; repaint(); }
    void setPointSize(float worldSize) { pointSize_ = worldSize; }
    void setOpacity(float alpha) { opacity_ = alpha; }

    // PointSink — called on the message thread by the scheduler
    void pointsUpdated(const float* xyz, int count) override;

    void paint(juce::Graphics& g) override;

private:
    const float* points_ = nullptr;
    int count_ = 0;

    juce::Colour colour_ {0xff4ecdc4};
    float pointSize_ = 0.08f;
    float opacity_ = 0.8f;
    juce::RectangleList<float> rects_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PointCloudView)
};

} // namespace nebula
