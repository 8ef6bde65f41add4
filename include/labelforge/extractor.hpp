#pragma once
#include <exception>
#include <string>
#include <vector>
#include "labelforge/errors.hpp"
#include "labelforge/polygon.hpp"

namespace lf {

// Wraps a Tracer: nullopt becomes an empty list, tracer failures become
// ExtractionError tagged with the category id.
class PolygonExtractor {
public:
    explicit PolygonExtractor(Tracer& tracer) : tracer_(tracer) {}

    std::vector<Polygon> extract(const BinaryMask& mask, ImageSize size, int category_id) const {
        std::optional<std::vector<Polygon>> res;
        try {
            res = tracer_.trace(mask, size);
        } catch (const std::exception& e) {
            throw ExtractionError("tracing category " + std::to_string(category_id) + " failed: " + e.what());
        }
        if (!res) return {};
        for (const auto& p : *res) {
            if (p.vertices.shape.size() != 2 || p.vertices.shape[1] != 2)
                throw ExtractionError("tracer returned a polygon that is not shaped {n, 2} for category " +
                                      std::to_string(category_id));
        }
        return std::move(*res);
    }

private:
    Tracer& tracer_;
};

} // namespace lf
