#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "labelforge/categories.hpp"
#include "labelforge/numeric.hpp"
#include "labelforge/polygon.hpp"

namespace lf {

struct CocoImage {
    int64_t id = 0;
    int64_t width = 0, height = 0;
    std::string file_name;
    std::string license, flickr_url, coco_url, date_captured;
};

// area stays 0 and bbox stays empty.
struct CocoAnn {
    int64_t id = 0;
    int iscrowd = 0;
    int64_t image_id = 0;
    int64_t category_id = 0;
    std::vector<NumericArray> segmentation;
    Scalar area = int64_t(0);
    NumericArray bbox;
};

struct CocoCat {
    int64_t id = 0;
    std::string name;
    Rgb color{};
    std::string supercategory;
};

// Name an image by its path relative to image_dir when a root is set (an
// empty root keeps the path as listed), otherwise by its base name. One
// leading separator is dropped.
inline std::string relative_file_name(const std::string& im_path, const std::optional<std::string>& image_dir) {
    std::string f;
    if (image_dir) {
        f = im_path;
        if (f.compare(0, image_dir->size(), *image_dir) == 0) f.erase(0, image_dir->size());
    } else {
        size_t p = im_path.find_last_of("/\\");
        f = (p == std::string::npos) ? im_path : im_path.substr(p + 1);
    }
    if (!f.empty() && (f[0] == '/' || f[0] == '\\')) f.erase(0, 1);
    return f;
}

// Owns the image/annotation id counters of one shard. Ids start at 1 and
// advance by one per record; nothing else hands them out.
class AnnotationAssembler {
public:
    int64_t add_image(const std::string& file_name, int64_t width, int64_t height) {
        CocoImage im;
        im.id = next_img_id_;
        im.width = width; im.height = height;
        im.file_name = file_name;
        images_.push_back(std::move(im));
        return next_img_id_++;
    }

    int64_t add_polygon(int64_t image_id, int category_id, const Polygon& poly) {
        if (image_id < 1 || image_id >= next_img_id_)
            throw std::invalid_argument("annotation refers to unknown image id " + std::to_string(image_id));
        if (!CategoryRegistry::contains(category_id))
            throw std::invalid_argument("annotation refers to unknown category id " + std::to_string(category_id));
        CocoAnn a;
        a.id = next_ann_id_;
        a.image_id = image_id;
        a.category_id = category_id;
        a.segmentation.push_back(poly.flattened());
        anns_.push_back(std::move(a));
        return next_ann_id_++;
    }

    const std::vector<CocoImage>& images() const { return images_; }
    const std::vector<CocoAnn>& annotations() const { return anns_; }
    int64_t next_image_id() const { return next_img_id_; }
    int64_t next_annotation_id() const { return next_ann_id_; }

private:
    std::vector<CocoImage> images_;
    std::vector<CocoAnn>   anns_;
    int64_t next_img_id_ = 1, next_ann_id_ = 1;
};

} // namespace lf
