#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include "Model/SculptureConfig.h"
#include "Core/SculptureEngine.h"
#include "Core/AnimationScheduler.h"
#include "Gesture/LandmarkReceiver.h"
#include "Rendering/PointCloudView.h"
#include "UI/ControlPanel.h"
#include "UI/NebulaLookAndFeel.h"
#include <memory>

namespace nebula {

class MainComponent : public juce::Component,
                      public ControlPanel::Listener,
                      private juce::Timer {
public:
    explicit MainComponent(const SculptureConfig& config);
    ~MainComponent() override;

    void resized() override;

    // Stop both cadences and persist settings
    void shutdown();

    // ControlPanel::Listener
    void shapeSelected(ShapeKind shape) override;
    void colourSelected(juce::Colour colour) override;
    void fullscreenToggled() override;

private:
    // juce::Timer — poll tracking status for the control bar
    void timerCallback() override;

    void saveConfig();

    NebulaLookAndFeel lookAndFeel_;
    SculptureConfig config_;
    SculptureEngine engine_;
    PointCloudView view_;
    ControlPanel controls_;
    AnimationScheduler scheduler_;
    LandmarkReceiver receiver_;
    bool receiverStarted_ = false;
    bool shutDown_ = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainComponent)
};

} // namespace nebula
