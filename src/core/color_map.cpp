#include "labelforge/color_map.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include "labelforge/categories.hpp"

namespace lf {

std::vector<Rgb> color_map_list(int num_classes, const std::vector<int>& custom) {
    if (num_classes < 1) throw std::invalid_argument("color map needs at least one class");
    if (custom.size() % 3 != 0) throw std::invalid_argument("custom colors must come in r,g,b triples");
    if (custom.size() / 3 > size_t(num_classes)) throw std::invalid_argument("more custom colors than classes");

    std::vector<Rgb> map(size_t(num_classes), Rgb{0,0,0});
    // class i takes the pattern of i+1, so class 0 is not black
    for (int i=0; i<num_classes; ++i) {
        int lab = i + 1, j = 0;
        while (lab) {
            map[i][0] |= uint8_t(((lab >> 0) & 1) << (7 - j));
            map[i][1] |= uint8_t(((lab >> 1) & 1) << (7 - j));
            map[i][2] |= uint8_t(((lab >> 2) & 1) << (7 - j));
            ++j;
            lab >>= 3;
        }
    }
    for (size_t k=0; k<custom.size(); ++k) {
        int v = custom[k];
        if (v < 0 || v > 255) throw std::invalid_argument("custom color component out of range: " + std::to_string(v));
        map[k/3][k%3] = uint8_t(v);
    }
    return map;
}

std::vector<int> registry_custom_colors() {
    std::vector<int> out;
    out.reserve(kCategories.size()*3);
    for (const auto& c : CategoryRegistry::list())
        for (auto v : c.color) out.push_back(v);
    return out;
}

RgbImage pseudo_color(const LabelMap& labels, const std::vector<Rgb>& palette) {
    if (palette.empty()) throw std::invalid_argument("empty palette");
    RgbImage out(labels.width, labels.height);
    const size_t top = palette.size() - 1;
    for (size_t i=0; i<labels.labels.size(); ++i) {
        const Rgb& c = palette[labels.labels[i] > top ? top : labels.labels[i]];
        out.rgb[i*3+0] = c[0]; out.rgb[i*3+1] = c[1]; out.rgb[i*3+2] = c[2];
    }
    return out;
}

RgbImage overlay(const RgbImage& image, const LabelMap& labels, const std::vector<Rgb>& palette, double weight) {
    if (image.size() != labels.size())
        throw std::invalid_argument("overlay: image is " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                                    ", prediction is " + std::to_string(labels.width) + "x" + std::to_string(labels.height));
    RgbImage pseudo = pseudo_color(labels, palette);
    RgbImage out(image.width, image.height);
    for (size_t i=0; i<out.rgb.size(); ++i) {
        double v = std::round(weight*image.rgb[i] + (1.0 - weight)*pseudo.rgb[i]);
        out.rgb[i] = (unsigned char)(v < 0 ? 0 : (v > 255 ? 255 : v));
    }
    return out;
}

} // namespace lf
