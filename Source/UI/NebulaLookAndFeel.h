#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include "Theme.h"

namespace nebula {

// Dark overlay styling for the control bar. Buttons flagged with the
// "swatch" property are drawn as colour discs; a toggled swatch gets a ring.
class NebulaLookAndFeel : public juce::LookAndFeel_V4 {
public:
    NebulaLookAndFeel();

    // Theme palette mapped onto the V4 colour scheme slots
    static juce::LookAndFeel_V4::ColourScheme makeColourScheme();

    static constexpr const char* SwatchProperty = "swatch";

    void drawButtonBackground(juce::Graphics&, juce::Button&,
                               const juce::Colour& backgroundColour,
                               bool shouldDrawButtonAsHighlighted,
                               bool shouldDrawButtonAsDown) override;

    void drawButtonText(juce::Graphics&, juce::TextButton&,
                        bool shouldDrawButtonAsHighlighted,
                        bool shouldDrawButtonAsDown) override;

    void drawComboBox(juce::Graphics&, int width, int height, bool isButtonDown,
                       int buttonX, int buttonY, int buttonW, int buttonH,
                       juce::ComboBox&) override;

    void drawPopupMenuBackground(juce::Graphics&, int width, int height) override;

    void drawPopupMenuItem(juce::Graphics&, const juce::Rectangle<int>& area,
                           bool isSeparator, bool isActive, bool isHighlighted,
                           bool isTicked, bool hasSubMenu,
                           const juce::String& text, const juce::String& shortcutKeyText,
                           const juce::Drawable* icon, const juce::Colour* textColour) override;

    int getPopupMenuBorderSize() override;

    juce::Font getPopupMenuFont() override;
    juce::Font getComboBoxFont(juce::ComboBox&) override;
};

} // namespace nebula
