#pragma once

#include "HandLandmarks.h"
#include "../Model/Interaction.h"
#include <vector>

namespace nebula {

// ============================================================
// GestureSignalExtractor — hand landmarks -> InteractionSample
//   0 hands : neutral
//   1 hand  : pinch scale, wrist position, wrist tilt
//   2 hands : wrist spread scale, midpoint position, roll + tilt
// Extra hands beyond the first two usable ones are ignored.
// ============================================================
namespace GestureSignalExtractor {

    // Two-hand mapping: wrist distance [0.1, 0.8] -> scale [0.5, 2.5]
    inline constexpr float TwoHandMinDist  = 0.1f;
    inline constexpr float TwoHandMaxDist  = 0.8f;
    inline constexpr float TwoHandScaleMin = 0.5f;
    inline constexpr float TwoHandScaleRange = 2.0f;
    inline constexpr float TwoHandTiltGain = 2.0f;

    // One-hand mapping: pinch distance [0.02, 0.2] -> scale [0.5, 2.0]
    inline constexpr float PinchMinDist    = 0.02f;
    inline constexpr float PinchMaxDist    = 0.2f;
    inline constexpr float PinchScaleMin   = 0.5f;
    inline constexpr float PinchScaleRange = 1.5f;
    inline constexpr float OneHandTiltGain = 3.0f;

    // Frame center -> scene offset
    inline constexpr float OffsetGainX = 8.0f;
    inline constexpr float OffsetGainY = 6.0f;

    InteractionSample extract(const std::vector<Hand>& hands);

    // Hands carrying finite wrist/thumb/index landmarks, clamped to [0,1].
    // Order is preserved.
    std::vector<Hand> usableHands(const std::vector<Hand>& hands);

    // Scene offset for a frame position (mirrored x, flipped y)
    Vec2 offsetFor(float frameX, float frameY);

} // namespace GestureSignalExtractor
} // namespace nebula
