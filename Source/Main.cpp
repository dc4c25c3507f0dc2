#include <juce_gui_basics/juce_gui_basics.h>
#include "MainComponent.h"
#include "UI/Theme.h"

namespace nebula {

class MainWindow : public juce::DocumentWindow {
public:
    MainWindow(const juce::String& name, const SculptureConfig& config)
        : DocumentWindow(name, Theme::Colors::SceneBg, DocumentWindow::allButtons)
    {
        setUsingNativeTitleBar(true);
        setContentOwned(new MainComponent(config), true);
        setResizable(true, true);
        centreWithSize(getWidth(), getHeight());
        setVisible(true);
    }

    void closeButtonPressed() override
    {
        juce::JUCEApplication::getInstance()->systemRequestedQuit();
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
};

class NebulaApplication : public juce::JUCEApplication {
public:
    NebulaApplication() = default;

    const juce::String getApplicationName() override { return "Nebula Sculpture"; }
    const juce::String getApplicationVersion() override { return "1.0.0"; }
    bool moreThanOneInstanceAllowed() override { return false; }

    void initialise(const juce::String&) override
    {
        SculptureConfig config;
        auto file = SculptureConfig::getDefaultFile();
        if (!config.load(file))
            DBG("[config] Using defaults (" + file.getFullPathName() + ")");

        mainWindow_ = std::make_unique<MainWindow>(getApplicationName(), config);
    }

    void shutdown() override
    {
        if (mainWindow_)
            if (auto* content = dynamic_cast<MainComponent*>(mainWindow_->getContentComponent()))
                content->shutdown();
        mainWindow_.reset();
    }

    void systemRequestedQuit() override { quit(); }

private:
    std::unique_ptr<MainWindow> mainWindow_;
};

} // namespace nebula

START_JUCE_APPLICATION(nebula::NebulaApplication)
