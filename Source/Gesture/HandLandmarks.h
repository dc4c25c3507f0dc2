#pragma once

#include <vector>

namespace nebula {

// Normalized frame coordinates, origin top-left, [0,1] on both axes
struct Landmark {
    float x = 0, y = 0;
};

// One detected hand: landmarks in detector order (21 for a full hand)
using Hand = std::vector<Landmark>;

namespace HandIndex {
    inline constexpr int Wrist     = 0;
    inline constexpr int ThumbTip  = 4;
    inline constexpr int IndexTip  = 8;
    inline constexpr int FullHand  = 21;

    // Highest index the extractor reads; a hand needs Required + 1 landmarks
    inline constexpr int Required  = IndexTip;
}

} // namespace nebula
