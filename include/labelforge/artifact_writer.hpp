#pragma once
#include <string>
#include <vector>
#include "labelforge/document.hpp"
#include "labelforge/image.hpp"
#include "labelforge/label_map.hpp"

namespace lf {

// Where one rank's outputs go, relative to save_dir.
struct OutputLayout {
    std::string save_dir = "output/result";
    int rank = 0, nranks = 1;

    std::string added_path(const std::string& file_name) const;    // added_prediction/<name>
    std::string pseudo_path(const std::string& file_name) const;   // pseudo_color_prediction/<stem>.png
    std::string label_path(const std::string& file_name) const;    // label_prediction/<stem>.exr
    // annotations.json, or annotations_rank<K>.json when several ranks share save_dir.
    std::string document_path() const;
};

struct RenderOptions {
    std::vector<Rgb> palette;
    double weight = 0.6;
    bool save_label_map = false;
};

// Creates parent directories as needed; every failure is a WriteError.
class ArtifactWriter {
public:
    ArtifactWriter(OutputLayout layout, RenderOptions render);

    void write_image_artifacts(const std::string& file_name, const RgbImage& image, const LabelMap& pred) const;

    // Written through a temporary file, so the path either holds a complete
    // document or nothing new.
    void write_document(const Document& doc) const;

    const OutputLayout& layout() const { return layout_; }

private:
    OutputLayout layout_;
    RenderOptions render_;
};

} // namespace lf
