#include "AnimationScheduler.h"
#include <algorithm>

namespace nebula {

AnimationScheduler::AnimationScheduler(SculptureEngine& engine, PointSink& sink)
    : engine_(engine), sink_(sink)
{
}

AnimationScheduler::~AnimationScheduler()
{
    stopTimer();
}

void AnimationScheduler::start(int refreshHz)
{
    refreshHz = std::clamp(refreshHz, 1, 240);
    // A restart only changes the rate; the animation clock keeps running
    if (!isTimerRunning()) {
        startTimeMs_ = juce::Time::getMillisecondCounterHiRes();
        lastTickMs_ = startTimeMs_;
    }
    startTimerHz(refreshHz);
    DBG("[scheduler] Started at " + juce::String(refreshHz) + " Hz");
}

void AnimationScheduler::stop()
{
    if (!isTimerRunning()) return;
    stopTimer();
    DBG("[scheduler] Stopped after " + juce::String((juce::int64)tickCount_) + " ticks");
}

double AnimationScheduler::getElapsedSeconds() const
{
    if (startTimeMs_ <= 0.0) return 0.0;
    return (juce::Time::getMillisecondCounterHiRes() - startTimeMs_) * 0.001;
}

void AnimationScheduler::step(float elapsedSeconds, float dtSeconds)
{
    engine_.tick(elapsedSeconds, dtSeconds);
    sink_.pointsUpdated(engine_.getPositions(), engine_.getParticleCount());
    ++tickCount_;
}

void AnimationScheduler::timerCallback()
{
    double now = juce::Time::getMillisecondCounterHiRes();
    // dt is capped at 250 ms across stalls
    double dtMs = std::min(now - lastTickMs_, 250.0);
    lastTickMs_ = now;

    step((float)getElapsedSeconds(), (float)(dtMs * 0.001));
}

} // namespace nebula
