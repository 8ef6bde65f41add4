#pragma once
#include <optional>
#include <vector>
#include "labelforge/label_map.hpp"
#include "labelforge/numeric.hpp"

namespace lf {

// Implicitly closed ring; vertices is shaped {n, 2} as (x, y) rows.
struct Polygon {
    NumericArray vertices;

    size_t points() const { return vertices.shape.empty() ? 0 : vertices.shape[0]; }
    // x0,y0,x1,y1,... in vertex order.
    NumericArray flattened() const { return vertices.flattened(); }
};

// Turns a 0/255 mask into boundary rings. nullopt means "nothing found".
class Tracer {
public:
    virtual ~Tracer() = default;
    virtual std::optional<std::vector<Polygon>> trace(const BinaryMask& mask, ImageSize size) = 0;
};

} // namespace lf
