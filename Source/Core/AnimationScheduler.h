#pragma once

#include "SculptureEngine.h"
#include "../Rendering/PointSink.h"
#include <juce_events/juce_events.h>

namespace nebula {

// ============================================================
// AnimationScheduler — message-thread timer at the display rate.
// Each callback ticks the engine and pushes the buffer to the sink.
// ============================================================
class AnimationScheduler : public juce::Timer {
public:
    AnimationScheduler(SculptureEngine& engine, PointSink& sink);
    ~AnimationScheduler() override;

    void start(int refreshHz = 60);
    void stop();
    bool isRunning() const { return isTimerRunning(); }

    // Seconds since the first start(); zero before that
    double getElapsedSeconds() const;

    // Run one tick with explicit timing (used by the timer and by tests)
    void step(float elapsedSeconds, float dtSeconds);

    uint64_t getTickCount() const { return tickCount_; }

    // juce::Timer
    void timerCallback() override;

private:
    SculptureEngine& engine_;
    PointSink& sink_;
    double startTimeMs_ = 0.0;
    double lastTickMs_ = 0.0;
    uint64_t tickCount_ = 0;

    JUCE_DECLARE_NON_COPYABLE(AnimationScheduler)
};

} // namespace nebula
