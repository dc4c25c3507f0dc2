#pragma once

#include "Point3.h"
#include <vector>

namespace nebula {

// ============================================================
// ParticleField — three parallel buffers of exactly N points.
//   base    : render output, rewritten every tick
//   current : morph position, eased toward target
//   target  : destination shape, rewritten on shape change
// Index i is the same logical particle in all three buffers.
// ============================================================
class ParticleField {
public:
    explicit ParticleField(int count);

    int size() const { return count_; }

    std::vector<Point3>& base()    { return base_; }
    std::vector<Point3>& current() { return current_; }
    std::vector<Point3>& target()  { return target_; }

    const std::vector<Point3>& base() const    { return base_; }
    const std::vector<Point3>& current() const { return current_; }
    const std::vector<Point3>& target() const  { return target_; }

    // Copy points into all three buffers (initial shape, no morph)
    void resetTo(const std::vector<Point3>& points);

    // Base buffer as N*3 contiguous floats for the renderer
    const float* flatPositions() const;

private:
    int count_;
    std::vector<Point3> base_;
    std::vector<Point3> current_;
    std::vector<Point3> target_;
};

} // namespace nebula
