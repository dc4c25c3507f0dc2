#include "PointCloudView.h"
#include "../UI/Theme.h"
#include <algorithm>
#include <cmath>

namespace nebula {

PointCloudView::PointCloudView()
{
    setOpaque(true);
    rects_.ensureStorageAllocated(4096);
}

void PointCloudView::pointsUpdated(const float* xyz, int count)
{
    points_ = xyz;
    count_ = count;
    repaint();
}

void PointCloudView::paint(juce::Graphics& g)
{
    g.fillAll(Theme::Colors::SceneBg);
    if (points_ == nullptr || count_ <= 0) return;

    float w = (float)getWidth(), h = (float)getHeight();
    float cx = w * 0.5f, cy = h * 0.5f;
    float focal = cy / std::tan(juce::degreesToRadians(Theme::CameraFovDeg) * 0.5f);

    rects_.clear();
    for (int i = 0; i < count_; ++i) {
        float x = points_[i * 3 + 0];
        float y = points_[i * 3 + 1];
        float z = points_[i * 3 + 2];

        float depth = Theme::CameraZ - z;
        if (depth < Theme::NearPlane) continue;

        float inv = focal / depth;
        float size = std::max(1.0f, pointSize_ * inv);
        float sx = cx + x * inv;
        float sy = cy - y * inv;
        if (sx < -size || sy < -size || sx > w + size || sy > h + size) continue;

        rects_.addWithoutMerging({sx - size * 0.5f, sy - size * 0.5f, size, size});
    }

    g.setColour(colour_.withMultipliedAlpha(opacity_));
    g.fillRectList(rects_);
}

} // namespace nebula
