#pragma once
#include <vector>
#include <cstdint>
#include <array>
#include "labelforge/label_map.hpp"

namespace lf {

using Rgb = std::array<uint8_t,3>;

// Interleaved 8-bit RGB, row-major.
struct RgbImage {
    int width=0, height=0;
    std::vector<unsigned char> rgb;

    RgbImage() = default;
    RgbImage(int w,int h) : width(w),height(h),rgb(size_t(w)*h*3,0) {}
    inline unsigned char* px(int x,int y) { return &rgb[(size_t(y)*width + x)*3]; }
    inline const unsigned char* px(int x,int y) const { return &rgb[(size_t(y)*width + x)*3]; }
    ImageSize size() const { return {width, height}; }
};

} // namespace lf
