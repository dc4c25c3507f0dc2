#include "ParticleField.h"
#include <algorithm>

namespace nebula {

static_assert(sizeof(Point3) == 3 * sizeof(float), "Point3 must be tightly packed");

ParticleField::ParticleField(int count)
    : count_(std::max(1, count)),
      base_((size_t)count_),
      current_((size_t)count_),
      target_((size_t)count_)
{
}

void ParticleField::resetTo(const std::vector<Point3>& points)
{
    auto n = std::min(points.size(), (size_t)count_);
    std::copy(points.begin(), points.begin() + (std::ptrdiff_t)n, base_.begin());
    std::copy(points.begin(), points.begin() + (std::ptrdiff_t)n, current_.begin());
    std::copy(points.begin(), points.begin() + (std::ptrdiff_t)n, target_.begin());
}

const float* ParticleField::flatPositions() const
{
    return &base_.data()->x;
}

} // namespace nebula
