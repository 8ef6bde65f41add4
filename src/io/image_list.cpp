#include "labelforge/image_list.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "labelforge/errors.hpp"

namespace fs = std::filesystem;

namespace lf {

bool has_image_suffix(const std::string& path) {
    static const char* kSuffixes[] = {".JPEG", ".jpeg", ".JPG", ".jpg", ".BMP", ".bmp",
                                      ".PNG", ".png", ".ppm"};
    const std::string ext = fs::path(path).extension().string();
    for (auto* s : kSuffixes) if (ext == s) return true;
    return false;
}

ImageList get_image_list(const std::string& image_path) {
    ImageList out;
    std::error_code ec;
    if (fs::is_regular_file(image_path, ec)) {
        if (has_image_suffix(image_path)) {
            out.images.push_back(image_path);
        } else {
            const std::string list_dir = fs::path(image_path).parent_path().string();
            out.image_dir = list_dir;
            std::ifstream f(image_path);
            if (!f) throw InputError("cannot read image list " + image_path);
            std::string line;
            while (std::getline(f, line)) {
                std::istringstream ss(line);
                std::string first;
                if (!(ss >> first)) continue;
                out.images.push_back((fs::path(list_dir) / first).string());
            }
        }
    } else if (fs::is_directory(image_path, ec)) {
        out.image_dir = image_path;
        for (auto it = fs::recursive_directory_iterator(image_path, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const fs::path& p = it->path();
            const std::string name = p.filename().string();
            if (it->is_directory()) {
                if (name == ".ipynb_checkpoints") it.disable_recursion_pending();
                continue;
            }
            if (name.empty() || name[0] == '.') continue;
            if (has_image_suffix(name)) out.images.push_back(p.string());
        }
        if (ec) throw InputError("walking " + image_path + ": " + ec.message());
        std::sort(out.images.begin(), out.images.end());
    } else {
        throw InputError("image_path is not a file or directory: " + image_path);
    }

    if (out.images.empty()) throw InputError("there are no image files in " + image_path);
    return out;
}

} // namespace lf
