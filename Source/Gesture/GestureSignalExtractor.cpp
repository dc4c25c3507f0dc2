#include "GestureSignalExtractor.h"
#include <algorithm>
#include <cmath>

namespace nebula {
namespace GestureSignalExtractor {

static float clamp01(float v)
{
    return std::max(0.0f, std::min(1.0f, v));
}

static float planarDistance(const Landmark& a, const Landmark& b)
{
    float dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

static bool hasRequiredLandmarks(const Hand& hand)
{
    if ((int)hand.size() <= HandIndex::Required)
        return false;
    for (int idx : {HandIndex::Wrist, HandIndex::ThumbTip, HandIndex::IndexTip}) {
        auto& lm = hand[(size_t)idx];
        if (!std::isfinite(lm.x) || !std::isfinite(lm.y))
            return false;
    }
    return true;
}

std::vector<Hand> usableHands(const std::vector<Hand>& hands)
{
    std::vector<Hand> result;
    for (auto& hand : hands) {
        if (!hasRequiredLandmarks(hand))
            continue;
        Hand clamped = hand;
        for (auto& lm : clamped) {
            lm.x = clamp01(lm.x);
            lm.y = clamp01(lm.y);
        }
        result.push_back(std::move(clamped));
    }
    return result;
}

// Video is shown mirrored, so x is inverted; image y grows downward
Vec2 offsetFor(float frameX, float frameY)
{
    return {(0.5f - frameX) * OffsetGainX, -(frameY - 0.5f) * OffsetGainY};
}

static InteractionSample fromTwoHands(const Hand& a, const Hand& b)
{
    auto& w1 = a[HandIndex::Wrist];
    auto& w2 = b[HandIndex::Wrist];

    InteractionSample s;
    float d = std::max(TwoHandMinDist, std::min(planarDistance(w1, w2), TwoHandMaxDist));
    s.scale = TwoHandScaleMin
            + ((d - TwoHandMinDist) / (TwoHandMaxDist - TwoHandMinDist)) * TwoHandScaleRange;

    float cx = (w1.x + w2.x) * 0.5f;
    float cy = (w1.y + w2.y) * 0.5f;
    s.offset = offsetFor(cx, cy);

    // Roll follows the line between wrists, sign-flipped for the mirror
    s.rotation.z = -std::atan2(w2.y - w1.y, w2.x - w1.x);
    s.rotation.y = (0.5f - cx) * TwoHandTiltGain;
    s.rotation.x = (cy - 0.5f) * TwoHandTiltGain;
    return s;
}

static InteractionSample fromOneHand(const Hand& hand)
{
    auto& wrist = hand[HandIndex::Wrist];
    auto& thumb = hand[HandIndex::ThumbTip];
    auto& index = hand[HandIndex::IndexTip];

    InteractionSample s;
    float d = std::max(PinchMinDist, std::min(planarDistance(thumb, index), PinchMaxDist));
    s.scale = PinchScaleMin + ((d - PinchMinDist) / (PinchMaxDist - PinchMinDist)) * PinchScaleRange;

    s.offset = offsetFor(wrist.x, wrist.y);

    // No usable roll from a single wrist
    s.rotation.y = (0.5f - wrist.x) * OneHandTiltGain;
    s.rotation.x = (wrist.y - 0.5f) * OneHandTiltGain;
    s.rotation.z = 0.0f;
    return s;
}

InteractionSample extract(const std::vector<Hand>& hands)
{
    auto usable = usableHands(hands);

    if (usable.size() >= 2)
        return fromTwoHands(usable[0], usable[1]);
    if (usable.size() == 1)
        return fromOneHand(usable[0]);
    return InteractionSample::neutral();
}

} // namespace GestureSignalExtractor
} // namespace nebula
