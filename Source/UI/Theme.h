#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

namespace nebula {
namespace Theme {

    // Camera looking down -Z from (0, 0, CameraZ)
    inline constexpr float CameraZ       = 8.0f;
    inline constexpr float CameraFovDeg  = 60.0f;
    inline constexpr float NearPlane     = 0.1f;

    // UI layout
    inline constexpr int ControlBarHeight = 44;
    inline constexpr int SwatchSize       = 22;
    inline constexpr int DefaultWindowW   = 1280;
    inline constexpr int DefaultWindowH   = 800;

    inline constexpr int SpaceSM = 4;
    inline constexpr int SpaceMD = 8;
    inline constexpr int SpaceLG = 12;

    inline constexpr float CornerRadius = 4.0f;
    inline constexpr float ButtonRadius = 4.0f;
    inline constexpr float PopupRadius  = 6.0f;
    inline constexpr float FontBase     = 12.0f;
    inline constexpr float FontToolbar  = 13.0f;

    // Swatches offered by the colour picker (ARGB)
    inline constexpr juce::uint32 SwatchColours[] = {
        0xffffffff, 0xffff6b6b, 0xff4ecdc4, 0xffffe66d, 0xffff9ff3, 0xffa29bfe
    };

    namespace Colors {
        inline const juce::Colour SceneBg     {0xff050505};
        inline const juce::Colour ControlBar  {0xcc111114};
        inline const juce::Colour Text        {0xffd8d8dc};
        inline const juce::Colour TextDim     {0xff6e6e78};
        inline const juce::Colour TextBright  {0xffffffff};
        inline const juce::Colour TextDisabled{0xff44444c};
        inline const juce::Colour Accent      {0xff4ecdc4};
        inline const juce::Colour ButtonBg    {0xff28282e};
        inline const juce::Colour ButtonActive{0xff3a3a44};
        inline const juce::Colour PopupBg     {0xf01a1a20};
        inline const juce::Colour Success     {0xff50c878};
        inline const juce::Colour Error       {0xffe85050};
        inline const juce::Colour Separator   {0xff252530};
    }

} // namespace Theme
} // namespace nebula
