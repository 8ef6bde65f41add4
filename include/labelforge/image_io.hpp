#pragma once
#include <string>
#include <vector>
#include "labelforge/image.hpp"
#include "labelforge/label_map.hpp"

namespace lf {

// Lower-cased extension including the dot, "" when there is none.
std::string extension_of(const std::string& path);

// PNG (any libpng color type, reduced to 8-bit RGB) and binary PPM.
bool load_image(const std::string& path, RgbImage& out);
// Reads only the header; false when load_image could not decode the file.
bool read_image_size(const std::string& path, ImageSize& size);
// PNG or PPM, chosen by extension; other extensions return false.
bool save_image(const std::string& path, const RgbImage& img);

// 8-bit grayscale or palette PNG; the gray value / palette index is the label.
bool load_label_png(const std::string& path, LabelMap& out);

// Palette PNG whose indices are the labels; ids past the palette are clamped.
bool save_palette_png(const std::string& path, const LabelMap& labels, const std::vector<Rgb>& palette);

} // namespace lf
