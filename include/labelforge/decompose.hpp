#pragma once
#include <vector>
#include <utility>
#include "labelforge/label_map.hpp"
#include "labelforge/categories.hpp"

namespace lf {

// 255 where the label equals category_id, 0 elsewhere.
inline BinaryMask category_mask(const LabelMap& pred, int category_id) {
    BinaryMask m(pred.width, pred.height);
    for (size_t i=0; i<pred.labels.size(); ++i)
        m.pixels[i] = (pred.labels[i] == uint32_t(category_id)) ? 255 : 0;
    return m;
}

// One mask per id in [first, last), absent categories included.
inline std::vector<std::pair<int, BinaryMask>>
decompose(const LabelMap& pred, int first = 0, int last = kCategoryCount) {
    std::vector<std::pair<int, BinaryMask>> out;
    out.reserve(size_t(last > first ? last - first : 0));
    for (int id=first; id<last; ++id) out.emplace_back(id, category_mask(pred, id));
    return out;
}

} // namespace lf
