#pragma once

#include "../Model/ShapeKind.h"
#include "Theme.h"
#include <juce_gui_basics/juce_gui_basics.h>
#include <algorithm>
#include <vector>

namespace nebula {

// Shape selector, colour swatches, fullscreen toggle, tracking status
class ControlPanel : public juce::Component {
public:
    class Listener {
    public:
        virtual ~Listener() = default;
        virtual void shapeSelected(ShapeKind shape) = 0;
        virtual void colourSelected(juce::Colour colour) = 0;
        virtual void fullscreenToggled() = 0;
    };

    ControlPanel();

    void paint(juce::Graphics& g) override;
    void resized() override;

    void setShape(ShapeKind shape);
    void setColour(juce::Colour colour);
    void setTrackingStatus(bool receiverRunning, int trackedHands);

    void addListener(Listener* l) { listeners_.push_back(l); }
    void removeListener(Listener* l)
    {
        listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), l), listeners_.end());
    }

private:
    static constexpr int NumSwatches = (int)(sizeof(Theme::SwatchColours) / sizeof(Theme::SwatchColours[0]));

    juce::ComboBox shapeSelector_;
    juce::TextButton swatches_[NumSwatches];
    juce::TextButton fullscreenButton_ {"Fullscreen"};
    juce::Label statusLabel_;
    juce::Colour statusColour_ = Theme::Colors::Error;

    std::vector<Listener*> listeners_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ControlPanel)
};

} // namespace nebula
