#include "labelforge/segmenter.hpp"

#include <filesystem>
#include "labelforge/errors.hpp"
#include "labelforge/image_io.hpp"

namespace fs = std::filesystem;

namespace lf {

std::string PrecomputedSegmenter::label_path(const std::string& file_name) const {
    fs::path rel(file_name);
    rel.replace_extension(".png");
    return (fs::path(label_dir_) / rel).string();
}

LabelMap PrecomputedSegmenter::infer(const ImageSample& sample) {
    const std::string p = label_path(sample.file_name);
    LabelMap m;
    if (!load_label_png(p, m)) throw InferenceError("cannot read label map " + p);
    if (m.size() != sample.image.size())
        throw InferenceError("label map " + p + " is " + std::to_string(m.width) + "x" + std::to_string(m.height) +
                             ", image is " + std::to_string(sample.image.width) + "x" + std::to_string(sample.image.height));
    return m;
}

} // namespace lf
