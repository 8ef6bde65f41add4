#pragma once
#include <optional>
#include <string>
#include <vector>

namespace lf {

struct ImageList {
    std::vector<std::string> images;
    // Root used to derive relative names: unset for a single image, "" for a
    // list file in the working directory.
    std::optional<std::string> image_dir;
};

bool has_image_suffix(const std::string& path);

// A single image, a list file (first token per line, relative to the list
// file's directory) or a directory walked recursively. Throws InputError
// when the path is missing or yields no images.
ImageList get_image_list(const std::string& image_path);

} // namespace lf
