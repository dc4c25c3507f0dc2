#include "NebulaLookAndFeel.h"

namespace nebula {

juce::LookAndFeel_V4::ColourScheme NebulaLookAndFeel::makeColourScheme()
{
    using namespace Theme::Colors;
    return { SceneBg,       // windowBackground
             ButtonBg,      // widgetBackground
             PopupBg,       // menuBackground
             Separator,     // outline
             Text,          // defaultText
             ButtonActive,  // defaultFill
             TextBright,    // highlightedText
             Accent,        // highlightedFill
             Text };        // menuText
}

NebulaLookAndFeel::NebulaLookAndFeel()
    : juce::LookAndFeel_V4(makeColourScheme())
{
}

void NebulaLookAndFeel::drawButtonBackground(juce::Graphics& g,
                                              juce::Button& button,
                                              const juce::Colour& backgroundColour,
                                              bool shouldDrawButtonAsHighlighted,
                                              bool shouldDrawButtonAsDown)
{
    auto bounds = button.getLocalBounds().toFloat().reduced(0.5f);
    auto baseColour = backgroundColour;

    if (shouldDrawButtonAsDown)
        baseColour = baseColour.brighter(0.15f);
    else if (shouldDrawButtonAsHighlighted)
        baseColour = baseColour.brighter(0.08f);

    if (button.getProperties()[SwatchProperty]) {
        auto disc = bounds.withSizeKeepingCentre(bounds.getHeight(), bounds.getHeight());
        if (button.getToggleState()) {
            g.setColour(Theme::Colors::TextBright);
            g.drawEllipse(disc.reduced(1.0f), 2.0f);
            disc = disc.reduced(4.0f);
        } else {
            disc = disc.reduced(2.0f);
        }
        g.setColour(baseColour);
        g.fillEllipse(disc);
        return;
    }

    // Text buttons float over the scene as pills
    float radius = bounds.getHeight() * 0.5f;
    g.setColour(baseColour.withMultipliedAlpha(0.85f));
    g.fillRoundedRectangle(bounds, radius);

    if (shouldDrawButtonAsHighlighted || button.getToggleState()) {
        g.setColour(Theme::Colors::Accent);
        g.drawRoundedRectangle(bounds, radius, 1.0f);
    }
}

void NebulaLookAndFeel::drawButtonText(juce::Graphics& g, juce::TextButton& button,
                                        bool /*shouldDrawButtonAsHighlighted*/,
                                        bool /*shouldDrawButtonAsDown*/)
{
    if (button.getProperties()[SwatchProperty])
        return;

    g.setFont(juce::Font(Theme::FontToolbar));
    g.setColour(button.findColour(button.getToggleState()
                                      ? juce::TextButton::textColourOnId
                                      : juce::TextButton::textColourOffId));
    g.drawText(button.getButtonText(), button.getLocalBounds(),
               juce::Justification::centred, false);
}

void NebulaLookAndFeel::drawComboBox(juce::Graphics& g, int width, int height,
                                      bool isButtonDown, int, int, int, int,
                                      juce::ComboBox& box)
{
    auto bounds = juce::Rectangle<float>((float)width, (float)height).reduced(0.5f);
    float radius = bounds.getHeight() * 0.5f;
    bool open = isButtonDown || box.isPopupActive();

    g.setColour(box.findColour(juce::ComboBox::backgroundColourId).withMultipliedAlpha(0.85f));
    g.fillRoundedRectangle(bounds, radius);
    g.setColour(open ? Theme::Colors::Accent : Theme::Colors::Separator);
    g.drawRoundedRectangle(bounds, radius, open ? 1.0f : 0.5f);

    // Chevron, flipped while the list is open
    auto c = juce::Point<float>(bounds.getRight() - radius - 4.0f, bounds.getCentreY());
    float dy = open ? -2.5f : 2.5f;
    juce::Path chevron;
    chevron.startNewSubPath(c.x - 4.0f, c.y - dy);
    chevron.lineTo(c.x, c.y + dy);
    chevron.lineTo(c.x + 4.0f, c.y - dy);
    g.setColour(open ? Theme::Colors::Accent : Theme::Colors::TextDim);
    g.strokePath(chevron, juce::PathStrokeType(1.5f, juce::PathStrokeType::curved,
                                               juce::PathStrokeType::rounded));
}

void NebulaLookAndFeel::drawPopupMenuBackground(juce::Graphics& g, int width, int height)
{
    g.fillAll(Theme::Colors::PopupBg);
    g.setColour(Theme::Colors::Accent);
    g.fillRect(0, 0, width, 2);
    g.setColour(Theme::Colors::Separator);
    g.drawRect(0, 0, width, height, 1);
}

void NebulaLookAndFeel::drawPopupMenuItem(juce::Graphics& g, const juce::Rectangle<int>& area,
                                          bool isSeparator, bool isActive, bool isHighlighted,
                                          bool isTicked, bool /*hasSubMenu*/,
                                          const juce::String& text,
                                          const juce::String& /*shortcutKeyText*/,
                                          const juce::Drawable* /*icon*/,
                                          const juce::Colour* textColour)
{
    if (isSeparator) {
        auto sepArea = area.reduced(8, 0);
        g.setColour(Theme::Colors::Separator);
        g.fillRect(sepArea.getX(), sepArea.getCentreY(), sepArea.getWidth(), 1);
        return;
    }

    auto r = area.reduced(4, 1);

    if (isHighlighted && isActive) {
        g.setColour(Theme::Colors::Accent.withAlpha(0.35f));
        g.fillRoundedRectangle(r.toFloat(), 3.0f);
    }

    auto col = textColour != nullptr ? *textColour
               : isHighlighted ? Theme::Colors::TextBright
               : isActive ? Theme::Colors::Text
               : Theme::Colors::TextDisabled;

    auto textArea = r.reduced(8, 0);

    // Active shape gets an accent bar instead of a tick glyph
    auto marker = textArea.removeFromLeft(10);
    if (isTicked) {
        g.setColour(Theme::Colors::Accent);
        g.fillRoundedRectangle(marker.withSizeKeepingCentre(3, r.getHeight() - 8).toFloat(), 1.5f);
    }

    g.setColour(col);
    g.setFont(juce::Font(Theme::FontBase));
    g.drawText(text, textArea, juce::Justification::centredLeft, true);
}

int NebulaLookAndFeel::getPopupMenuBorderSize()
{
    return 4;
}

juce::Font NebulaLookAndFeel::getPopupMenuFont()
{
    return juce::Font(Theme::FontBase);
}

juce::Font NebulaLookAndFeel::getComboBoxFont(juce::ComboBox&)
{
    return juce::Font(Theme::FontToolbar);
}

} // namespace nebula
