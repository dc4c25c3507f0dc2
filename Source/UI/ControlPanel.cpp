#include "ControlPanel.h"
#include "NebulaLookAndFeel.h"

namespace nebula {

ControlPanel::ControlPanel()
{
    // ComboBox item ids are 1-based
    for (int i = 0; i < NumShapeKinds; ++i)
        shapeSelector_.addItem(shapeDisplayName(static_cast<ShapeKind>(i)), i + 1);
    shapeSelector_.onChange = [this] {
        int id = shapeSelector_.getSelectedId();
        if (id <= 0) return;
        for (auto* l : listeners_)
            l->shapeSelected(static_cast<ShapeKind>(id - 1));
    };
    addAndMakeVisible(shapeSelector_);

    for (int i = 0; i < NumSwatches; ++i) {
        juce::Colour c(Theme::SwatchColours[i]);
        swatches_[i].setColour(juce::TextButton::buttonColourId, c);
        swatches_[i].setColour(juce::TextButton::buttonOnColourId, c);
        swatches_[i].setClickingTogglesState(false);
        swatches_[i].getProperties().set(NebulaLookAndFeel::SwatchProperty, true);
        swatches_[i].onClick = [this, c] {
            setColour(c);
            for (auto* l : listeners_)
                l->colourSelected(c);
        };
        addAndMakeVisible(swatches_[i]);
    }

    fullscreenButton_.setColour(juce::TextButton::buttonColourId, Theme::Colors::ButtonBg);
    fullscreenButton_.onClick = [this] {
        for (auto* l : listeners_)
            l->fullscreenToggled();
    };
    addAndMakeVisible(fullscreenButton_);

    statusLabel_.setColour(juce::Label::textColourId, Theme::Colors::Text);
    statusLabel_.setFont(juce::Font(Theme::FontBase));
    addAndMakeVisible(statusLabel_);
    setTrackingStatus(false, 0);
}

void ControlPanel::paint(juce::Graphics& g)
{
    auto bounds = getLocalBounds().toFloat();
    g.setColour(Theme::Colors::ControlBar);
    g.fillRoundedRectangle(bounds, Theme::CornerRadius);

    // Status dot left of the label
    auto lb = statusLabel_.getBounds().toFloat();
    g.setColour(statusColour_);
    g.fillEllipse(lb.getX() - 12.0f, lb.getCentreY() - 4.0f, 8.0f, 8.0f);
}

void ControlPanel::resized()
{
    auto area = getLocalBounds().reduced(Theme::SpaceMD);

    shapeSelector_.setBounds(area.removeFromLeft(140));
    area.removeFromLeft(Theme::SpaceLG);

    for (auto& sw : swatches_) {
        sw.setBounds(area.removeFromLeft(Theme::SwatchSize)
                         .withSizeKeepingCentre(Theme::SwatchSize, Theme::SwatchSize));
        area.removeFromLeft(Theme::SpaceSM);
    }

    fullscreenButton_.setBounds(area.removeFromRight(100));
    area.removeFromRight(Theme::SpaceLG);

    area.removeFromLeft(Theme::SpaceLG + 12);
    statusLabel_.setBounds(area);
}

void ControlPanel::setShape(ShapeKind shape)
{
    shapeSelector_.setSelectedId((int)shape + 1, juce::dontSendNotification);
}

void ControlPanel::setColour(juce::Colour colour)
{
    for (int i = 0; i < NumSwatches; ++i) {
        bool active = juce::Colour(Theme::SwatchColours[i]) == colour;
        swatches_[i].setToggleState(active, juce::dontSendNotification);
    }
}

void ControlPanel::setTrackingStatus(bool receiverRunning, int trackedHands)
{
    juce::String text;
    if (!receiverRunning) {
        text = "Gesture input unavailable";
        statusColour_ = Theme::Colors::Error;
    } else if (trackedHands == 0) {
        text = "Waiting for hands...";
        statusColour_ = Theme::Colors::TextDim;
    } else {
        text = trackedHands == 1 ? "1 hand: pinch to scale"
                                 : "2 hands: spread to scale, tilt to roll";
        statusColour_ = Theme::Colors::Success;
    }

    if (statusLabel_.getText() != text) {
        statusLabel_.setText(text, juce::dontSendNotification);
        repaint();
    }
}

} // namespace nebula
