#include "MainComponent.h"
#include "UI/Theme.h"

namespace nebula {

static juce::Colour parseColour(const std::string& argb)
{
    return juce::Colour::fromString(juce::String(argb));
}

MainComponent::MainComponent(const SculptureConfig& config)
    : config_(config),
      engine_(config),
      scheduler_(engine_, view_),
      receiver_(engine_.getInteractionCell())
{
    setLookAndFeel(&lookAndFeel_);

    view_.setColour(parseColour(config_.colour));
    view_.setPointSize(config_.pointSize);
    view_.setOpacity(config_.opacity);
    addAndMakeVisible(view_);

    controls_.setShape(config_.shape);
    controls_.setColour(parseColour(config_.colour));
    controls_.addListener(this);
    addAndMakeVisible(controls_);

    // Without a landmark source the sculpture keeps breathing at neutral
    receiverStarted_ = receiver_.start(config_.oscPort, config_.trackingTimeoutMs);
    controls_.setTrackingStatus(receiverStarted_, 0);

    scheduler_.start(config_.refreshHz);
    startTimerHz(4);

    setSize(Theme::DefaultWindowW, Theme::DefaultWindowH);
}

MainComponent::~MainComponent()
{
    shutdown();
    controls_.removeListener(this);
    setLookAndFeel(nullptr);
}

void MainComponent::shutdown()
{
    if (shutDown_) return;
    shutDown_ = true;

    stopTimer();
    scheduler_.stop();
    receiver_.stop();
    saveConfig();
}

void MainComponent::resized()
{
    auto area = getLocalBounds();
    view_.setBounds(area);

    auto bar = area.reduced(Theme::SpaceLG).removeFromBottom(Theme::ControlBarHeight);
    controls_.setBounds(bar);
}

void MainComponent::shapeSelected(ShapeKind shape)
{
    engine_.setShape(shape);
    config_.shape = shape;
}

void MainComponent::colourSelected(juce::Colour colour)
{
    view_.setColour(colour);
    config_.colour = colour.toString().toStdString();
}

void MainComponent::fullscreenToggled()
{
    auto& desktop = juce::Desktop::getInstance();
    if (desktop.getKioskModeComponent() != nullptr)
        desktop.setKioskModeComponent(nullptr);
    else if (auto* top = getTopLevelComponent())
        desktop.setKioskModeComponent(top, false);
}

void MainComponent::timerCallback()
{
    controls_.setTrackingStatus(receiverStarted_ && receiver_.isRunning(),
                                receiver_.getTrackedHands());
}

void MainComponent::saveConfig()
{
    auto file = SculptureConfig::getDefaultFile();
    if (config_.save(file))
        DBG("[config] Saved " + file.getFullPathName());
}

} // namespace nebula
