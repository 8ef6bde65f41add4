#pragma once
#include <string>
#include "labelforge/image.hpp"
#include "labelforge/label_map.hpp"

namespace lf {

struct ImageSample {
    std::string path;        // as listed
    std::string file_name;   // relative name used for every output
    RgbImage image;
};

// Produces one label per pixel, at the size of sample.image.
class Segmenter {
public:
    virtual ~Segmenter() = default;
    virtual LabelMap infer(const ImageSample& sample) = 0;
};

// Reads predictions made elsewhere: <label_dir>/<file_name stem>.png, gray
// or palette indexed. Throws InferenceError when missing or mis-sized.
class PrecomputedSegmenter : public Segmenter {
public:
    explicit PrecomputedSegmenter(std::string label_dir) : label_dir_(std::move(label_dir)) {}
    LabelMap infer(const ImageSample& sample) override;
    std::string label_path(const std::string& file_name) const;

private:
    std::string label_dir_;
};

} // namespace lf
