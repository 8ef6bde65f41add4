#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace lf {

struct ImageSize { int width=0, height=0; };

inline bool operator==(const ImageSize& a, const ImageSize& b){ return a.width==b.width && a.height==b.height; }
inline bool operator!=(const ImageSize& a, const ImageSize& b){ return !(a==b); }

// Per-pixel category ids as produced by the segmenter, row-major.
struct LabelMap {
    int width=0, height=0;
    std::vector<uint32_t> labels;

    LabelMap() = default;
    LabelMap(int w,int h) : width(w),height(h),labels(size_t(w)*h,0) {}
    LabelMap(int w,int h,std::vector<uint32_t> v) : width(w),height(h),labels(std::move(v)) {}
    inline uint32_t& at(int x,int y) { return labels[size_t(y)*width + x]; }
    inline const uint32_t& at(int x,int y) const { return labels[size_t(y)*width + x]; }
    ImageSize size() const { return {width, height}; }
};

// Single-channel 0/255 mask for one category of one image.
struct BinaryMask {
    int width=0, height=0;
    std::vector<uint8_t> pixels;

    BinaryMask() = default;
    BinaryMask(int w,int h) : width(w),height(h),pixels(size_t(w)*h,0) {}
    inline uint8_t& at(int x,int y) { return pixels[size_t(y)*width + x]; }
    inline const uint8_t& at(int x,int y) const { return pixels[size_t(y)*width + x]; }
    inline bool foreground(int x,int y) const { return at(x,y) != 0; }
    ImageSize size() const { return {width, height}; }
    bool empty() const {
        for (auto p : pixels) if (p) return false;
        return true;
    }
};

} // namespace lf
