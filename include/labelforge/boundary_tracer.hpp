#pragma once
#include "labelforge/polygon.hpp"

namespace lf {

// Outer pixel-edge boundary of every 4-connected foreground component,
// components ordered by their first pixel in raster order. Vertices sit on
// pixel corners; collinear runs are merged unless keep_every_point is set.
class BoundaryTracer : public Tracer {
public:
    explicit BoundaryTracer(bool keep_every_point=false) : keep_every_point_(keep_every_point) {}

    std::optional<std::vector<Polygon>> trace(const BinaryMask& mask, ImageSize size) override;

private:
    bool keep_every_point_;
};

} // namespace lf
