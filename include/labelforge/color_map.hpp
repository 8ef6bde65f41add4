#pragma once
#include <vector>
#include "labelforge/image.hpp"
#include "labelforge/label_map.hpp"

namespace lf {

// Bit-interleaved palette: bit k of (class index + 1) lands in channel k%3
// at bit 7-k/3. custom is a flat r,g,b,... list that overrides the head.
std::vector<Rgb> color_map_list(int num_classes, const std::vector<int>& custom = {});

// Registry colors as a flat r,g,b,... list, for use as custom colors.
std::vector<int> registry_custom_colors();

RgbImage pseudo_color(const LabelMap& labels, const std::vector<Rgb>& palette);

// weight*image + (1-weight)*pseudo_color, rounded and saturated.
RgbImage overlay(const RgbImage& image, const LabelMap& labels, const std::vector<Rgb>& palette, double weight);

} // namespace lf
