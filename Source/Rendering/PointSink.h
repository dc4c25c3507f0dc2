#pragma once

namespace nebula {

// Receives the composed position buffer once per tick.
// `xyz` holds count * 3 floats and stays valid until the next tick.
class PointSink {
public:
    virtual ~PointSink() = default;
    virtual void pointsUpdated(const float* xyz, int count) = 0;
};

} // namespace nebula
